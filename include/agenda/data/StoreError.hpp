#pragma once

#include <QString>

namespace agenda {
namespace data {

struct StoreError
{
    enum class Kind
    {
        None,
        NotFound,
        Validation,
        Io,
    };

    Kind kind = Kind::None;
    QString message;
    QString path;

    bool isError() const { return kind != Kind::None; }
};

// Fills target when non-null. Io failures are logged with their path.
void reportStoreError(StoreError *target, StoreError::Kind kind, const QString &message, const QString &path = QString());

} // namespace data
} // namespace agenda
