#pragma once

#include <QApplication>

namespace AppTheme {

void applyDark(QApplication& app);
void applyLight(QApplication& app);

inline void apply(QApplication& app, bool dark) {
    if (dark) applyDark(app); else applyLight(app);
}

} // namespace AppTheme
