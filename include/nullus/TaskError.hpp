#pragma once

#include <QString>
#include <stdexcept>

namespace nullus {

class TaskError : public std::runtime_error
{
public:
    explicit TaskError(const QString &message)
        : std::runtime_error(message.toStdString())
    {
    }

    QString message() const { return QString::fromStdString(what()); }
};

// Bad date, empty description, invalid pattern, missing ids.
class ValidationError : public TaskError
{
public:
    using TaskError::TaskError;
};

// Task id outside the addressable range.
class NotFoundError : public TaskError
{
public:
    using TaskError::TaskError;
};

// Unreadable or malformed store file, failed write.
class StorageError : public TaskError
{
public:
    using TaskError::TaskError;
};

} // namespace nullus
