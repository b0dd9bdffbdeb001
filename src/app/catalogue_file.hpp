#pragma once

#include "core/catalogue.hpp"
#include "core/result.hpp"
#include <QByteArray>
#include <QString>

namespace kioku::app {

/**
 * Parse a catalogue snapshot:
 *
 *   {
 *     "subjects": [{"id": 1, "type": "radical", "level": 1}, ...],
 *     "deleted": [8761],
 *     "accessibleLevel": 3
 *   }
 *
 * "deleted" and "accessibleLevel" are optional.
 */
[[nodiscard]] Result<InMemoryCatalogue, Error> parse_catalogue(const QByteArray& json);

[[nodiscard]] Result<InMemoryCatalogue, Error> load_catalogue(const QString& path);

} // namespace kioku::app
