#pragma once

/**
 * Plain-text coordinate files
 *
 * One point per line, "x y" or "x,y". Blank lines and lines starting with '#'
 * are skipped. Line order is point identity, so files round-trip by position.
 */

#include "knowmap/types.hpp"

#include <string>
#include <vector>

namespace knowmap {
namespace io {

// @throws IOError on a missing file or a malformed line (line number in the context)
PointSet read_points(const std::string& path);

/**
 * Writes points to path + ".tmp" and renames it over path. A failed write
 * removes the temporary file and leaves any existing file at path untouched.
 * @throws IOError
 */
void write_points_atomic(const std::string& path, const PointSet& points);

struct PointFile {
    std::string path;
    const PointSet* points;
};

/**
 * Replaces a group of files together. Every temporary file is written first;
 * if any write fails, all of them are removed and no file at any path is
 * touched. Only then is each temporary renamed into place.
 * @throws IOError
 */
void write_point_files_atomic(const std::vector<PointFile>& files);

} // namespace io
} // namespace knowmap
