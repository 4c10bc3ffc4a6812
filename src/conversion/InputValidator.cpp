#include "InputValidator.h"
#include <QFileInfo>

bool InputValidator::validate(const ExportRequest& request, ConversionJob& job) {
    m_error = ValidationError::None;
    m_errorPath.clear();

    if (request.files.isEmpty())
        return fail(ValidationError::EmptySelection);

    std::vector<SourceFile> sources;
    sources.reserve(request.files.size());
    for (const QString& path : request.files) {
        QFileInfo info(path);
        if (path.isEmpty() || !info.exists() || !info.isFile())
            return fail(ValidationError::FileNotFound, path);
        if (!hasAcceptedExtension(path))
            return fail(ValidationError::UnsupportedFormat, path);

        SourceFile source;
        source.path = info.absoluteFilePath();
        source.position = static_cast<int>(sources.size());
        sources.push_back(source);
    }

    const QString title = request.title.trimmed();
    if (title.isEmpty())
        return fail(ValidationError::MissingTitle);

    const QString author = request.author.trimmed();
    if (author.isEmpty())
        return fail(ValidationError::MissingAuthor);

    if (request.destination.trimmed().isEmpty())
        return fail(ValidationError::MissingDestination);

    job.sources = std::move(sources);
    job.metadata.title = title;
    job.metadata.author = author;
    job.destination = QFileInfo(request.destination).absoluteFilePath();
    return true;
}

QString InputValidator::errorString() const {
    switch (m_error) {
        case ValidationError::None:
            return {};
        case ValidationError::EmptySelection:
            return "No input files selected.";
        case ValidationError::FileNotFound:
            return QString("File not found: %1").arg(m_errorPath);
        case ValidationError::UnsupportedFormat:
            return QString("Unsupported format (expected %1): %2")
                .arg(m_settings.acceptedExtensions.join(", "), m_errorPath);
        case ValidationError::MissingTitle:
            return "Title is required.";
        case ValidationError::MissingAuthor:
            return "Author is required.";
        case ValidationError::MissingDestination:
            return "No destination file chosen.";
    }
    return {};
}

bool InputValidator::fail(ValidationError error, const QString& path) {
    m_error = error;
    m_errorPath = path;
    return false;
}

bool InputValidator::hasAcceptedExtension(const QString& path) const {
    const QString suffix = QFileInfo(path).suffix().toLower();
    for (const QString& ext : m_settings.acceptedExtensions) {
        if (suffix == ext.toLower()) return true;
    }
    return false;
}
