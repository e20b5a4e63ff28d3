#include "quakemigrate/io/output_writer.hpp"
#include "quakemigrate/core/time_util.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>

namespace fs = std::filesystem;

namespace quakemigrate {

namespace {

const char* COA_HEADER = "DT,COA,COA_N,NODE,X,Y,Z,NSTA";
const char* TRIGGER_HEADER =
    "EventNum,EventID,CoaTime,COA_V,COA_N,COA_X,COA_Y,COA_Z,MinTime,MaxTime";

const char VOLUME_MAGIC[8] = {'Q', 'M', 'C', 'O', 'A', 'V', 'O', 'L'};
const uint32_t VOLUME_VERSION = 1;

std::vector<std::string> splitCSV(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item.erase(item.find_last_not_of(" \t\r") + 1);
        fields.push_back(item);
    }
    return fields;
}

bool toDouble(const std::string& s, double& out) {
    try {
        size_t used = 0;
        out = std::stod(s, &used);
        return used == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

bool toSize(const std::string& s, size_t& out) {
    try {
        size_t used = 0;
        out = static_cast<size_t>(std::stoull(s, &used));
        return used == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

// Empty string for an estimate the locator could not form
std::string estimateField(const LocationEstimate& est, int axis, bool uncertainty) {
    if (!est.valid) return "";
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4)
        << (uncertainty ? est.uncertainty[axis] : est.position[axis]);
    return oss.str();
}

template <typename T>
void writeBinary(std::ofstream& out, const T& value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(T));
}

} // namespace

OutputWriter::OutputWriter(const OutputSettings& settings)
    : settings_(settings)
{
}

std::string OutputWriter::runDirectory() const {
    return (fs::path(settings_.directory) / settings_.run_name).string();
}

std::string OutputWriter::coalescencePath(TimePoint day) const {
    return (fs::path(runDirectory()) / "detect" / "scan" /
            (settings_.run_name + "_" + dayLabel(day) + ".coa")).string();
}

std::string OutputWriter::triggerPath(TimePoint day) const {
    return (fs::path(runDirectory()) / "trigger" /
            (settings_.run_name + "_" + dayLabel(day) + "_TriggeredEvents.csv")).string();
}

std::string OutputWriter::triggerSummaryPath(TimePoint day) const {
    return (fs::path(runDirectory()) / "trigger" /
            (settings_.run_name + "_" + dayLabel(day) + "_Summary.txt")).string();
}

std::string OutputWriter::eventPath(const std::string& uid) const {
    return (fs::path(runDirectory()) / "locate" / "events" / (uid + ".event")).string();
}

std::string OutputWriter::pickPath(const std::string& uid) const {
    return (fs::path(runDirectory()) / "locate" / "picks" / (uid + ".picks")).string();
}

std::string OutputWriter::amplitudePath(const std::string& uid) const {
    return (fs::path(runDirectory()) / "locate" / "amplitudes" / (uid + ".amps")).string();
}

std::string OutputWriter::volumePath(const std::string& uid) const {
    return (fs::path(runDirectory()) / "locate" / "volumes" / (uid + ".coavol")).string();
}

bool OutputWriter::ensureDirectory(const std::string& path) const {
    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    if (ec) {
        std::cerr << "OutputWriter: cannot create directory for " << path
                  << ": " << ec.message() << std::endl;
        return false;
    }
    return true;
}

std::vector<TimePoint> OutputWriter::daysCovering(TimePoint start, TimePoint end) const {
    std::vector<TimePoint> days;
    for (TimePoint day = startOfDay(start); day < end || day == startOfDay(start);
         day = addSeconds(day, 86400.0)) {
        days.push_back(day);
    }
    return days;
}

bool OutputWriter::appendCoalescence(const CoalescenceSeries& series) const {
    size_t i = 0;
    while (i < series.size()) {
        TimePoint day = startOfDay(series[i].time);
        std::string path = coalescencePath(day);
        if (!ensureDirectory(path)) return false;

        bool fresh = !fs::exists(path);
        std::ofstream out(path, std::ios::app);
        if (!out.is_open()) {
            std::cerr << "OutputWriter: cannot open " << path << std::endl;
            return false;
        }
        if (fresh) out << COA_HEADER << "\n";

        out << std::setprecision(10);
        for (; i < series.size() && startOfDay(series[i].time) == day; i++) {
            const CoalescenceSample& s = series[i];
            out << formatTime(s.time) << "," << s.value << "," << s.normalised << ","
                << s.node << "," << s.position.x << "," << s.position.y << ","
                << s.position.z << "," << s.contributors << "\n";
        }
        if (!out.good()) {
            std::cerr << "OutputWriter: write failed for " << path << std::endl;
            return false;
        }
    }
    return true;
}

bool OutputWriter::readCoalescence(TimePoint start, TimePoint end,
                                   CoalescenceSeries& series) const {
    for (TimePoint day : daysCovering(start, end)) {
        std::string path = coalescencePath(day);
        if (!fs::exists(path)) continue;

        std::ifstream in(path);
        if (!in.is_open()) {
            std::cerr << "OutputWriter: cannot open " << path << std::endl;
            return false;
        }

        std::string line;
        size_t line_no = 0;
        size_t repeated = 0;
        while (std::getline(in, line)) {
            line_no++;
            if (line.empty() || line.rfind("DT,", 0) == 0) continue;

            auto f = splitCSV(line);
            CoalescenceSample s;
            if (f.size() != 8 || !parseTime(f[0], s.time) ||
                !toDouble(f[1], s.value) || !toDouble(f[2], s.normalised) ||
                !toSize(f[3], s.node) || !toDouble(f[4], s.position.x) ||
                !toDouble(f[5], s.position.y) || !toDouble(f[6], s.position.z) ||
                !toSize(f[7], s.contributors)) {
                std::cerr << "OutputWriter: malformed row " << line_no << " in "
                          << path << std::endl;
                return false;
            }
            if (s.time < start || !(s.time < end)) continue;
            // Rows repeated by a resumed run are not later than the last one
            if (!series.append(s)) repeated++;
        }
        if (repeated > 0 && settings_.verbose) {
            std::cout << "OutputWriter: skipped " << repeated << " repeated rows in "
                      << path << std::endl;
        }
    }
    return true;
}

bool OutputWriter::writeTriggers(const std::vector<Trigger>& triggers,
                                 const TriggerSettings& settings) const {
    std::map<TimePoint, std::vector<const Trigger*>> by_day;
    for (const auto& t : triggers) {
        by_day[startOfDay(t.peak_time)].push_back(&t);
    }

    for (const auto& [day, list] : by_day) {
        std::string path = triggerPath(day);
        if (!ensureDirectory(path)) return false;

        std::ofstream out(path);
        if (!out.is_open()) {
            std::cerr << "OutputWriter: cannot open " << path << std::endl;
            return false;
        }
        out << TRIGGER_HEADER << "\n";
        out << std::setprecision(10);
        for (const Trigger* t : list) {
            out << t->event_num << "," << t->uid << "," << formatTime(t->peak_time) << ","
                << t->peak_value << "," << t->peak_normalised << ","
                << t->position.x << "," << t->position.y << "," << t->position.z << ","
                << formatTime(t->start_time) << "," << formatTime(t->end_time) << "\n";
        }
        if (!out.good()) {
            std::cerr << "OutputWriter: write failed for " << path << std::endl;
            return false;
        }

        std::string summary_path = triggerSummaryPath(day);
        std::ofstream summary(summary_path);
        if (!summary.is_open()) {
            std::cerr << "OutputWriter: cannot open " << summary_path << std::endl;
            return false;
        }
        summary << "Trigger summary " << settings_.run_name << " " << dayLabel(day) << "\n";
        summary << "  Threshold method:   " << thresholdMethodToString(settings.method) << "\n";
        summary << "  Threshold:          " << settings.threshold << "\n";
        if (settings.method == ThresholdMethod::Dynamic) {
            summary << "  Window:             " << settings.window << " s\n";
            summary << "  Multiplier:         " << settings.multiplier << "\n";
        }
        summary << "  Min event interval: " << settings.min_event_interval << " s\n";
        summary << "  Marginal window:    " << settings.marginal_window << " s\n";
        summary << "  Normalised:         " << (settings.normalise_coalescence ? "yes" : "no")
                << "\n";
        summary << "  Triggered events:   " << list.size() << "\n\n";
        summary << std::fixed;
        for (const Trigger* t : list) {
            summary << std::setw(5) << t->event_num << "  " << formatTime(t->peak_time)
                    << std::setprecision(3)
                    << "  coa " << t->peak_value
                    << "  (" << t->position.x << ", " << t->position.y << ", "
                    << t->position.z << ") km\n";
        }
    }
    return true;
}

bool OutputWriter::readTriggers(TimePoint start, TimePoint end,
                                std::vector<Trigger>& triggers) const {
    for (TimePoint day : daysCovering(start, end)) {
        std::string path = triggerPath(day);
        if (!fs::exists(path)) continue;

        std::ifstream in(path);
        if (!in.is_open()) {
            std::cerr << "OutputWriter: cannot open " << path << std::endl;
            return false;
        }

        std::string line;
        size_t line_no = 0;
        while (std::getline(in, line)) {
            line_no++;
            if (line.empty() || line.rfind("EventNum,", 0) == 0) continue;

            auto f = splitCSV(line);
            Trigger t;
            double num = 0;
            if (f.size() != 10 || !toDouble(f[0], num) || !parseTime(f[2], t.peak_time) ||
                !toDouble(f[3], t.peak_value) || !toDouble(f[4], t.peak_normalised) ||
                !toDouble(f[5], t.position.x) || !toDouble(f[6], t.position.y) ||
                !toDouble(f[7], t.position.z) || !parseTime(f[8], t.start_time) ||
                !parseTime(f[9], t.end_time)) {
                std::cerr << "OutputWriter: malformed row " << line_no << " in "
                          << path << std::endl;
                return false;
            }
            t.event_num = static_cast<int>(num);
            t.uid = f[1];
            if (t.peak_time < start || !(t.peak_time < end)) continue;
            triggers.push_back(t);
        }
    }
    return true;
}

bool OutputWriter::writeEvent(const Event& event) const {
    std::string path = eventPath(event.uid);
    if (!ensureDirectory(path)) return false;

    std::ofstream out(path);
    if (!out.is_open()) {
        std::cerr << "OutputWriter: cannot open " << path << std::endl;
        return false;
    }

    out << "EventID,DT,RefinedDT,TRIG_COA,COA,COA_NORM,NSTA,X,Y,Z,ErrX,ErrY,ErrZ,"
        << "GAU_X,GAU_Y,GAU_Z,GAU_ErrX,GAU_ErrY,GAU_ErrZ,"
        << "COV_X,COV_Y,COV_Z,COV_ErrX,COV_ErrY,COV_ErrZ,"
        << "LAT,LON,DEPTH,ML,ML_Err,ML_NSTA,Quality\n";

    out << std::fixed << std::setprecision(4);
    out << event.uid << "," << formatTime(event.origin_time) << ","
        << formatTime(event.refined_origin_time) << ","
        << event.trigger_value << "," << event.coa_value << "," << event.coa_normalised << ","
        << event.contributors << ","
        << event.spline.position.x << "," << event.spline.position.y << ","
        << event.spline.position.z << ","
        << event.spline.uncertainty.x << "," << event.spline.uncertainty.y << ","
        << event.spline.uncertainty.z;
    for (const LocationEstimate* est : {&event.gaussian, &event.covariance}) {
        for (int axis = 0; axis < 3; axis++) out << "," << estimateField(*est, axis, false);
        for (int axis = 0; axis < 3; axis++) out << "," << estimateField(*est, axis, true);
    }
    if (event.has_geographic) {
        out << std::setprecision(6) << "," << event.geographic.latitude << ","
            << event.geographic.longitude << "," << std::setprecision(4)
            << event.geographic.depth;
    } else {
        out << ",,,";
    }
    if (event.magnitude && event.magnitude->valid()) {
        out << std::setprecision(3) << "," << event.magnitude->value << ","
            << event.magnitude->uncertainty << "," << event.magnitude->station_count;
    } else {
        out << ",,,";
    }
    out << "," << qualityFlagsToString(event.quality_flags) << "\n";

    if (!out.good()) {
        std::cerr << "OutputWriter: write failed for " << path << std::endl;
        return false;
    }
    return true;
}

bool OutputWriter::writePicks(const Event& event) const {
    std::string path = pickPath(event.uid);
    if (!ensureDirectory(path)) return false;

    std::ofstream out(path);
    if (!out.is_open()) {
        std::cerr << "OutputWriter: cannot open " << path << std::endl;
        return false;
    }

    out << "Station,Phase,ModelledTime,PickTime,PickError,SNR,Amplitude,Sigma,Valid,Status\n";
    out << std::fixed << std::setprecision(4);
    for (const auto& pick : event.picks) {
        out << pick.station << "," << phaseTypeToString(pick.phase) << ","
            << formatTime(pick.modelled_time) << ",";
        if (pick.valid) {
            out << formatTime(pick.time) << "," << pick.uncertainty << "," << pick.snr;
        } else {
            out << "-1,-1,-1";
        }
        out << "," << pick.amplitude << "," << pick.sigma << ","
            << (pick.valid ? 1 : 0) << "," << pickStatusToString(pick.status) << "\n";
    }

    if (!out.good()) {
        std::cerr << "OutputWriter: write failed for " << path << std::endl;
        return false;
    }
    return true;
}

bool OutputWriter::writeAmplitudes(const Event& event) const {
    if (!event.magnitude) return true;

    std::string path = amplitudePath(event.uid);
    if (!ensureDirectory(path)) return false;

    std::ofstream out(path);
    if (!out.is_open()) {
        std::cerr << "OutputWriter: cannot open " << path << std::endl;
        return false;
    }

    out << "Stream,EpiDist,HypDist,Amplitude,Period,Noise,ML,Correction,Picked,Used\n";
    out << std::setprecision(6);
    for (const auto& sm : event.magnitude->station_magnitudes) {
        out << sm.stream_id.toString() << "," << sm.epicentral_distance << ","
            << sm.hypocentral_distance << "," << sm.amplitude << "," << sm.period << ","
            << sm.noise_amplitude << "," << sm.magnitude << "," << sm.correction << ","
            << (sm.picked ? 1 : 0) << "," << (sm.used ? 1 : 0) << "\n";
    }

    if (!out.good()) {
        std::cerr << "OutputWriter: write failed for " << path << std::endl;
        return false;
    }
    return true;
}

bool OutputWriter::writeVolume(const std::string& uid, const Grid3D& grid,
                               const CoalescenceVolume& volume) const {
    std::string path = volumePath(uid);
    if (!ensureDirectory(path)) return false;

    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
        std::cerr << "OutputWriter: cannot open " << path << std::endl;
        return false;
    }

    out.write(VOLUME_MAGIC, sizeof(VOLUME_MAGIC));
    writeBinary(out, VOLUME_VERSION);
    for (int axis = 0; axis < 3; axis++) writeBinary(out, grid.llCorner()[axis]);
    for (int axis = 0; axis < 3; axis++) writeBinary(out, grid.spacing()[axis]);
    for (int axis = 0; axis < 3; axis++) writeBinary(out, static_cast<uint64_t>(grid.count(axis)));

    int64_t start_us = std::chrono::duration_cast<Duration>(
        volume.startTime().time_since_epoch()).count();
    writeBinary(out, start_us);
    writeBinary(out, volume.samplingRate());
    writeBinary(out, static_cast<uint64_t>(volume.filledTicks()));

    for (size_t t = 0; t < volume.filledTicks(); t++) {
        out.write(reinterpret_cast<const char*>(volume.tick(t)),
                  static_cast<std::streamsize>(volume.nodeCount() * sizeof(double)));
    }

    if (!out.good()) {
        std::cerr << "OutputWriter: write failed for " << path << std::endl;
        return false;
    }
    return true;
}

} // namespace quakemigrate
