#include "quakemigrate/lut/lookup_table.hpp"
#include "quakemigrate/lut/traveltime_solver.hpp"
#include "quakemigrate/core/exception.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>

namespace quakemigrate {

namespace {

const char LUT_MAGIC[8] = {'Q', 'M', 'L', 'U', 'T', 0, 0, 0};
const uint32_t LUT_VERSION = 1;
const uint32_t BYTE_ORDER_MARK = 0x01020304;

template <typename T>
void writeValue(std::ostream& out, const T& value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(T));
}

template <typename T>
bool readValue(std::istream& in, T& value) {
    in.read(reinterpret_cast<char*>(&value), sizeof(T));
    return static_cast<bool>(in);
}

void writeString(std::ostream& out, const std::string& s) {
    writeValue(out, static_cast<uint32_t>(s.size()));
    out.write(s.data(), static_cast<std::streamsize>(s.size()));
}

bool readString(std::istream& in, std::string& s) {
    uint32_t len = 0;
    if (!readValue(in, len) || len > 4096) return false;
    s.resize(len);
    in.read(&s[0], len);
    return static_cast<bool>(in);
}

bool readDoubles(std::istream& in, std::vector<double>& values, size_t count) {
    values.resize(count);
    in.read(reinterpret_cast<char*>(values.data()),
            static_cast<std::streamsize>(count * sizeof(double)));
    return static_cast<bool>(in);
}

} // anonymous namespace

double LookupTable::requiredBytes(size_t nodes, size_t stations, size_t phases, bool takeoff) {
    double bytes = static_cast<double>(nodes) * stations * phases * sizeof(double);
    return takeoff ? 2 * bytes : bytes;
}

void LookupTable::checkMemory(const Grid3D& grid, size_t stations, size_t phases,
                              bool takeoff, double max_memory_mb) {
    double mb = requiredBytes(grid.nodeTotal(), stations, phases, takeoff) / (1024.0 * 1024.0);
    if (mb > max_memory_mb) {
        std::ostringstream msg;
        msg << "lut: tables for grid " << grid.nx() << "x" << grid.ny() << "x" << grid.nz()
            << " (" << grid.nodeTotal() << " nodes), " << stations << " stations, "
            << phases << " phases need " << mb << " MB, limit is "
            << max_memory_mb << " MB";
        throw ResourceError(msg.str());
    }
}

void LookupTable::build(const Grid3D& grid,
                        const std::vector<LutStation>& stations,
                        const std::vector<PhaseType>& phases,
                        const VelocityModel& model,
                        const LutBuildOptions& options) {
    if (grid.nodeTotal() == 0) {
        throw ConfigError("lut: grid has no nodes");
    }
    if (stations.empty()) {
        throw ConfigError("lut: no stations");
    }
    if (phases.empty()) {
        throw ConfigError("lut: no phases");
    }
    for (PhaseType phase : phases) {
        if (phase == PhaseType::Unknown) {
            throw ConfigError("lut: unknown phase");
        }
    }
    checkMemory(grid, stations.size(), phases.size(), options.takeoff_angles,
                options.max_memory_mb);

    grid_ = grid;
    stations_ = stations;
    phases_ = phases;
    model_name_ = model.name();
    fraction_tt_ = options.fraction_tt;
    has_takeoff_ = options.takeoff_angles;
    tables_.assign(pairCount(), std::vector<double>());
    takeoffs_.assign(has_takeoff_ ? pairCount() : 0, std::vector<double>());

    std::unique_ptr<GraphTraveltimeSolver> solver;
    if (!model.isHomogeneous()) {
        solver = std::make_unique<GraphTraveltimeSolver>(grid_, options.graph_order);
    }

    const size_t n = grid_.nodeTotal();
    for (size_t s = 0; s < stations_.size(); s++) {
        for (size_t p = 0; p < phases_.size(); p++) {
            std::vector<double>& tt = tables_[pairIndex(s, p)];
            if (solver) {
                tt = solver->solve(stations_[s].position, model, phases_[p]);
            } else {
                double v = model.velocity(phases_[p], stations_[s].position);
                if (!(v > 0)) {
                    throw ConfigError("lut: velocity must be positive for phase " +
                                      phaseTypeToString(phases_[p]));
                }
                tt.resize(n);
                for (size_t node = 0; node < n; node++) {
                    tt[node] = stations_[s].position.distanceTo(grid_.nodePosition(node)) / v;
                }
            }
            if (has_takeoff_) {
                takeoffs_[pairIndex(s, p)] = computeTakeoff(tt);
            }
        }
        std::cout << "LUT: station " << stations_[s].id << " done ("
                  << (s + 1) << "/" << stations_.size() << ")" << std::endl;
    }
}

std::vector<double> LookupTable::computeTakeoff(const std::vector<double>& tt) const {
    const size_t n = grid_.nodeTotal();
    std::vector<double> angles(n, 0.0);
    const Point3& h = grid_.spacing();

    for (size_t node = 0; node < n; node++) {
        auto ijk = grid_.indices(node);
        double grad[3];
        for (int axis = 0; axis < 3; axis++) {
            size_t c = ijk[axis];
            size_t lo = c > 0 ? c - 1 : c;
            size_t hi = c + 1 < grid_.count(axis) ? c + 1 : c;
            if (lo == hi) {
                grad[axis] = 0;
                continue;
            }
            auto lo_ijk = ijk;
            auto hi_ijk = ijk;
            lo_ijk[axis] = lo;
            hi_ijk[axis] = hi;
            double t_lo = tt[grid_.index(lo_ijk[0], lo_ijk[1], lo_ijk[2])];
            double t_hi = tt[grid_.index(hi_ijk[0], hi_ijk[1], hi_ijk[2])];
            grad[axis] = (t_hi - t_lo) / ((hi - lo) * h[axis]);
        }
        // Rays leave the node down the travel-time gradient
        double norm = std::sqrt(grad[0] * grad[0] + grad[1] * grad[1] + grad[2] * grad[2]);
        if (norm == 0) continue;
        double cos_angle = std::clamp(-grad[2] / norm, -1.0, 1.0);
        angles[node] = std::acos(cos_angle) * constants::RAD_TO_DEG;
    }
    return angles;
}

int LookupTable::stationIndex(const std::string& id) const {
    for (size_t i = 0; i < stations_.size(); i++) {
        if (stations_[i].id == id) return static_cast<int>(i);
    }
    return -1;
}

int LookupTable::phaseIndex(PhaseType phase) const {
    for (size_t i = 0; i < phases_.size(); i++) {
        if (phases_[i] == phase) return static_cast<int>(i);
    }
    return -1;
}

double LookupTable::traveltimeAt(size_t station, size_t phase, const Point3& p) const {
    const std::vector<double>& tt = tables_[pairIndex(station, phase)];
    Point3 f = grid_.fractionalIndex(p);

    size_t i0[3];
    double w[3];
    for (int axis = 0; axis < 3; axis++) {
        double last = static_cast<double>(grid_.count(axis) - 1);
        double c = std::clamp(f[axis], 0.0, last);
        double base = std::floor(c);
        if (base >= last) base = std::max(last - 1, 0.0);
        i0[axis] = static_cast<size_t>(base);
        w[axis] = grid_.count(axis) > 1 ? c - base : 0.0;
    }

    double result = 0;
    for (int di = 0; di <= 1; di++) {
        double wx = di ? w[0] : 1 - w[0];
        if (wx == 0) continue;
        for (int dj = 0; dj <= 1; dj++) {
            double wy = dj ? w[1] : 1 - w[1];
            if (wy == 0) continue;
            for (int dk = 0; dk <= 1; dk++) {
                double wz = dk ? w[2] : 1 - w[2];
                if (wz == 0) continue;
                result += wx * wy * wz * tt[grid_.index(i0[0] + di, i0[1] + dj, i0[2] + dk)];
            }
        }
    }
    return result;
}

double LookupTable::maxTraveltime() const {
    double m = 0;
    for (const auto& tt : tables_) {
        for (double t : tt) m = std::max(m, t);
    }
    return m;
}

size_t LookupTable::memoryBytes() const {
    size_t bytes = 0;
    for (const auto& tt : tables_) bytes += tt.size() * sizeof(double);
    for (const auto& ta : takeoffs_) bytes += ta.size() * sizeof(double);
    return bytes;
}

LookupTable LookupTable::decimate(const std::array<int, 3>& factors) const {
    LookupTable result;
    result.grid_ = grid_.decimate(factors);
    result.stations_ = stations_;
    result.phases_ = phases_;
    result.model_name_ = model_name_;
    result.fraction_tt_ = fraction_tt_;
    result.has_takeoff_ = has_takeoff_;

    const Grid3D& g = result.grid_;
    auto pick = [&](const std::vector<double>& src) {
        std::vector<double> out(g.nodeTotal());
        for (size_t i = 0; i < g.nx(); i++) {
            for (size_t j = 0; j < g.ny(); j++) {
                for (size_t k = 0; k < g.nz(); k++) {
                    out[g.index(i, j, k)] = src[grid_.index(i * factors[0],
                                                            j * factors[1],
                                                            k * factors[2])];
                }
            }
        }
        return out;
    };

    for (const auto& tt : tables_) result.tables_.push_back(pick(tt));
    for (const auto& ta : takeoffs_) result.takeoffs_.push_back(pick(ta));
    return result;
}

bool LookupTable::save(const std::string& filename) const {
    std::ofstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "Failed to open LUT file for writing: " << filename << std::endl;
        return false;
    }

    file.write(LUT_MAGIC, sizeof(LUT_MAGIC));
    writeValue(file, LUT_VERSION);
    writeValue(file, BYTE_ORDER_MARK);

    for (int axis = 0; axis < 3; axis++) writeValue(file, grid_.llCorner()[axis]);
    for (int axis = 0; axis < 3; axis++) writeValue(file, grid_.spacing()[axis]);
    for (int axis = 0; axis < 3; axis++) writeValue(file, static_cast<uint64_t>(grid_.count(axis)));

    writeValue(file, fraction_tt_);
    writeString(file, model_name_);

    writeValue(file, static_cast<uint32_t>(stations_.size()));
    for (const auto& st : stations_) {
        writeString(file, st.id);
        writeValue(file, st.position.x);
        writeValue(file, st.position.y);
        writeValue(file, st.position.z);
    }

    writeValue(file, static_cast<uint32_t>(phases_.size()));
    for (PhaseType phase : phases_) {
        writeValue(file, static_cast<char>(phaseTypeToString(phase)[0]));
    }
    writeValue(file, static_cast<uint8_t>(has_takeoff_ ? 1 : 0));

    for (const auto& tt : tables_) {
        file.write(reinterpret_cast<const char*>(tt.data()),
                   static_cast<std::streamsize>(tt.size() * sizeof(double)));
    }
    for (const auto& ta : takeoffs_) {
        file.write(reinterpret_cast<const char*>(ta.data()),
                   static_cast<std::streamsize>(ta.size() * sizeof(double)));
    }

    if (!file) {
        std::cerr << "Error writing LUT file: " << filename << std::endl;
        return false;
    }
    return true;
}

bool LookupTable::load(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "Failed to open LUT file: " << filename << std::endl;
        return false;
    }

    auto fail = [&](const std::string& why) {
        std::cerr << "Invalid LUT file " << filename << ": " << why << std::endl;
        return false;
    };

    char magic[sizeof(LUT_MAGIC)];
    file.read(magic, sizeof(magic));
    if (!file || std::memcmp(magic, LUT_MAGIC, sizeof(LUT_MAGIC)) != 0) {
        return fail("bad magic");
    }
    uint32_t version = 0, mark = 0;
    if (!readValue(file, version) || !readValue(file, mark)) return fail("truncated header");
    if (mark != BYTE_ORDER_MARK) return fail("foreign byte order");
    if (version != LUT_VERSION) return fail("unsupported version " + std::to_string(version));

    Point3 ll, spacing;
    std::array<size_t, 3> counts;
    for (int axis = 0; axis < 3; axis++) {
        if (!readValue(file, ll[axis])) return fail("truncated grid");
    }
    for (int axis = 0; axis < 3; axis++) {
        if (!readValue(file, spacing[axis]) || !(spacing[axis] > 0)) return fail("bad spacing");
    }
    for (int axis = 0; axis < 3; axis++) {
        uint64_t c = 0;
        if (!readValue(file, c) || c == 0 || c > (1u << 24)) return fail("bad node count");
        counts[axis] = static_cast<size_t>(c);
    }

    double fraction_tt = 0;
    std::string model_name;
    if (!readValue(file, fraction_tt) || !readString(file, model_name)) {
        return fail("truncated header");
    }

    uint32_t nstations = 0;
    if (!readValue(file, nstations) || nstations == 0 || nstations > 100000) {
        return fail("bad station count");
    }
    std::vector<LutStation> stations(nstations);
    for (auto& st : stations) {
        if (!readString(file, st.id) ||
            !readValue(file, st.position.x) ||
            !readValue(file, st.position.y) ||
            !readValue(file, st.position.z)) {
            return fail("truncated station list");
        }
    }

    uint32_t nphases = 0;
    if (!readValue(file, nphases) || nphases == 0 || nphases > 16) return fail("bad phase count");
    std::vector<PhaseType> phases;
    for (uint32_t i = 0; i < nphases; i++) {
        char c = 0;
        if (!readValue(file, c)) return fail("truncated phase list");
        PhaseType phase = stringToPhaseType(std::string(1, c));
        if (phase == PhaseType::Unknown) return fail("unknown phase");
        phases.push_back(phase);
    }
    uint8_t takeoff_flag = 0;
    if (!readValue(file, takeoff_flag) || takeoff_flag > 1) return fail("bad take-off flag");

    // Table payload must fit in what is left of the file before allocating it
    const std::streamoff payload_start = file.tellg();
    file.seekg(0, std::ios::end);
    const std::streamoff file_end = file.tellg();
    file.seekg(payload_start);
    if (payload_start < 0 || file_end < payload_start || !file) return fail("unreadable file");
    const double remaining = static_cast<double>(file_end - payload_start);
    const double needed = static_cast<double>(counts[0]) * counts[1] * counts[2] *
                          nstations * nphases * sizeof(double) * (takeoff_flag ? 2 : 1);
    if (needed > remaining) return fail("tables larger than the file");

    Grid3D grid(ll, spacing, counts);
    const size_t pairs = static_cast<size_t>(nstations) * nphases;
    std::vector<std::vector<double>> tables(pairs);
    for (auto& tt : tables) {
        if (!readDoubles(file, tt, grid.nodeTotal())) return fail("truncated tables");
    }
    std::vector<std::vector<double>> takeoffs(takeoff_flag ? pairs : 0);
    for (auto& ta : takeoffs) {
        if (!readDoubles(file, ta, grid.nodeTotal())) return fail("truncated take-off angles");
    }
    if (file.peek() != std::char_traits<char>::eof()) return fail("trailing data");

    grid_ = grid;
    stations_.swap(stations);
    phases_.swap(phases);
    model_name_ = model_name;
    fraction_tt_ = fraction_tt;
    has_takeoff_ = takeoff_flag != 0;
    tables_.swap(tables);
    takeoffs_.swap(takeoffs);
    return true;
}

} // namespace quakemigrate
