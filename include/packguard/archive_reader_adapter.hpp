#pragma once

#include "packguard/io.hpp"

#include <archive.h>

#include <memory>
#include <string>

namespace packguard {

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

using ArchiveReadPtr = std::unique_ptr<archive, ArchiveReadDeleter>;

// Reader restricted to the containers sound packs ship in (zip, tar) with any
// compression filter. Returns null if libarchive cannot allocate.
ArchiveReadPtr NewPackArchiveReader();

int OpenArchiveFromReader(struct archive* ar, IReader& reader);
std::string ArchiveErr(struct archive* ar);

} // namespace packguard
