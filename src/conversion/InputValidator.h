#pragma once

#include <QString>
#include "ConversionTypes.h"

enum class ValidationError {
    None,
    EmptySelection,
    FileNotFound,
    UnsupportedFormat,
    MissingTitle,
    MissingAuthor,
    MissingDestination
};

// Gates an ExportRequest into a ConversionJob. Only stats the inputs, never opens them.
class InputValidator {
public:
    explicit InputValidator(const ConversionSettings& settings = ConversionSettings())
        : m_settings(settings) {}

    // On success fills `job` (sources, trimmed metadata, destination) and returns true.
    bool validate(const ExportRequest& request, ConversionJob& job);

    ValidationError error() const { return m_error; }
    QString errorPath() const { return m_errorPath; }
    QString errorString() const;

private:
    bool fail(ValidationError error, const QString& path = {});
    bool hasAcceptedExtension(const QString& path) const;

    ConversionSettings m_settings;
    ValidationError m_error = ValidationError::None;
    QString m_errorPath;
};
