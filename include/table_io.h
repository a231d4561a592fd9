#ifndef FORTS_TABLE_IO_H
#define FORTS_TABLE_IO_H

#include "config.hpp"
#include "tables.h"

#define TABLES_EXTENSION "tables"  // default extension for saved table collections

namespace ForTS {

// Binary checkpoint of a table collection (cereal).
// Both return false if the file cannot be opened.  loadTableCollection
// throws IOException if the archive is corrupt or describes invalid tables.
bool saveTableCollection(const FilePath& filename, const TableCollection& tables);
bool loadTableCollection(const FilePath& filename, TableCollection& tables);

} // namespace ForTS

#endif // FORTS_TABLE_IO_H
