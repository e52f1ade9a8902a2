#include "knowmap/io/point_io.hpp"
#include "knowmap/error.hpp"
#include "knowmap/logging.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <system_error>

namespace knowmap {
namespace io {

namespace {

std::string trim(const std::string& s) {
    const size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    const size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

} // namespace

PointSet read_points(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw IOError("cannot open coordinate file", path, "check the path and read permissions");
    }

    PointSet points;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        for (char& c : line) {
            if (c == ',') c = ' ';
        }

        std::istringstream fields(line);
        Point2D p;
        std::string extra;
        if (!(fields >> p.x >> p.y) || (fields >> extra)) {
            throw IOError("malformed coordinate line, expected 'x y'", path + ":" + std::to_string(line_no));
        }
        points.push_back(p);
    }
    if (in.bad()) {
        throw IOError("read failed", path);
    }

    LOG_DEBUG("Read ", points.size(), " points from ", path);
    return points;
}

void write_points_atomic(const std::string& path, const PointSet& points) {
    write_point_files_atomic({{path, &points}});
}

void write_point_files_atomic(const std::vector<PointFile>& files) {
    std::vector<std::string> written;
    auto discard = [&written]() {
        for (const auto& tmp : written) std::remove(tmp.c_str());
    };

    for (const auto& file : files) {
        const std::string tmp = file.path + ".tmp";
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            discard();
            throw IOError("cannot create temporary file", tmp, "check that the output directory exists and is writable");
        }
        written.push_back(tmp);

        out << std::setprecision(std::numeric_limits<double>::max_digits10);
        for (const auto& p : *file.points) {
            out << p.x << ' ' << p.y << '\n';
        }
        out.flush();
        if (!out) {
            out.close();
            discard();
            throw IOError("write failed", tmp);
        }
    }

    for (size_t i = 0; i < files.size(); ++i) {
        std::error_code ec;
        std::filesystem::rename(written[i], files[i].path, ec);
        if (ec) {
            for (size_t j = i; j < written.size(); ++j) std::remove(written[j].c_str());
            throw IOError("cannot replace " + files[i].path + ": " + ec.message(), written[i]);
        }
        LOG_DEBUG("Wrote ", files[i].points->size(), " points to ", files[i].path);
    }
}

} // namespace io
} // namespace knowmap
