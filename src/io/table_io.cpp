#include "table_io.h"

#include <cereal/archives/binary.hpp>
#include <cereal/types/vector.hpp>

#include <fstream>

namespace ForTS {

bool saveTableCollection(const FilePath& filename, const TableCollection& tables) {
    std::ofstream os(filename, std::ios::binary);
    if (!os) {
        spdlog::error("[saveTableCollection] Cannot open {}", filename.string());
        return false;
    }

    {
        cereal::BinaryOutputArchive oar(os);
        oar(tables);
    }

    spdlog::debug("[saveTableCollection] {} nodes, {} edges saved to {}",
        tables.num_nodes(), tables.num_edges(), filename.string());
    return static_cast<bool>(os);
}

bool loadTableCollection(const FilePath& filename, TableCollection& tables) {
    std::ifstream is(filename, std::ios::binary);
    if (!is) {
        spdlog::error("[loadTableCollection] Cannot open {}", filename.string());
        return false;
    }

    // a bad archive leaves `tables` untouched
    TableCollection loaded(1);
    try {
        cereal::BinaryInputArchive iar(is);
        iar(loaded);
    }
    catch (const cereal::Exception& e) {
        spdlog::error("[loadTableCollection] {}: {}", filename.string(), e.what());
        throw IOException("corrupt table archive " + filename.string());
    }

    if (loaded.genome_length() < 1) {
        spdlog::error("[loadTableCollection] {} has genome length {}", filename.string(), loaded.genome_length());
        throw IOException("invalid genome length in " + filename.string());
    }
    for (const auto& e : loaded.edges()) {
        if (e.parent < 0 || e.child < 0
            || static_cast<std::size_t>(e.parent) >= loaded.num_nodes()
            || static_cast<std::size_t>(e.child) >= loaded.num_nodes()) {
            throw IOException("edge to a missing node in " + filename.string());
        }
    }

    tables = std::move(loaded);
    spdlog::debug("[loadTableCollection] {} nodes, {} edges loaded from {}",
        tables.num_nodes(), tables.num_edges(), filename.string());
    return true;
}

} // namespace ForTS
