/**
 * QuakeMigrate - Detection and location of seismicity by waveform migration
 *
 * Commands:
 * 1. lut      computes the travel-time lookup table of the configured grid
 * 2. detect   migrates continuous onsets into the coalescence time series
 * 3. trigger  cuts candidate events from the coalescence
 * 4. locate   locates and picks every candidate, with local magnitudes
 * 5. info     summarises a lookup table and the event catalog
 */

#include <iostream>
#include <signal.h>
#include <atomic>
#include <string>

#include "quakemigrate/core/archive.hpp"
#include "quakemigrate/core/config.hpp"
#include "quakemigrate/core/exception.hpp"
#include "quakemigrate/core/settings.hpp"
#include "quakemigrate/core/station.hpp"
#include "quakemigrate/core/time_util.hpp"
#include "quakemigrate/database/catalog_database.hpp"
#include "quakemigrate/pipeline/quake_scan.hpp"

using namespace quakemigrate;

// Run being processed, stopped on SIGINT/SIGTERM
std::atomic<QuakeScan*> g_scan(nullptr);

void signalHandler(int signum) {
    (void)signum;
    QuakeScan* scan = g_scan.load();
    if (scan) scan->requestStop();
}

void printUsage(const char* progname) {
    std::cout << "Usage: " << progname << " <command> -c <config> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  lut        Compute and save the travel-time lookup table (lut.file)\n";
    std::cout << "  detect     Migrate continuous data into the coalescence time series\n";
    std::cout << "  trigger    Cut candidate events from the coalescence\n";
    std::cout << "  locate     Locate, pick and measure the candidate events\n";
    std::cout << "  info       Summarise the lookup table and the event catalog\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config <file>    Configuration file (default: quakemigrate.conf)\n";
    std::cout << "  -s, --start <time>     Start of the processed span (YYYY-MM-DDTHH:MM:SS)\n";
    std::cout << "  -e, --end <time>       End of the processed span (exclusive)\n";
    std::cout << "  -h, --help             Show this help message\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progname << " lut -c project.conf\n";
    std::cout << "  " << progname << " detect -c project.conf -s 2021-03-04T00:00:00"
              << " -e 2021-03-05T00:00:00\n";
    std::cout << "  " << progname << " locate -c project.conf -s 2021-03-04 -e 2021-03-05\n";
}

namespace {

ProjectionPtr makeProjection(const RunSettings& settings, const StationInventory& inventory) {
    if (settings.input.has_reference) {
        return std::make_shared<LocalTangentProjection>(settings.input.reference_latitude,
                                                        settings.input.reference_longitude);
    }
    GeoPoint centre = inventory.centroid();
    return std::make_shared<LocalTangentProjection>(centre.latitude, centre.longitude);
}

bool parseSpan(const std::string& start_text, const std::string& end_text,
               TimePoint& start, TimePoint& end) {
    if (start_text.empty() || end_text.empty()) {
        std::cerr << "This command needs --start and --end" << std::endl;
        return false;
    }
    if (!parseTime(start_text, start)) {
        std::cerr << "Invalid start time: " << start_text << std::endl;
        return false;
    }
    if (!parseTime(end_text, end)) {
        std::cerr << "Invalid end time: " << end_text << std::endl;
        return false;
    }
    if (!(start < end)) {
        std::cerr << "Start time must precede end time" << std::endl;
        return false;
    }
    return true;
}

int runInfo(QuakeScan& scan, const RunSettings& settings) {
    if (scan.loadLut()) {
        const LookupTable& lut = *scan.lut();
        const Grid3D& grid = lut.grid();
        std::cout << "LUT " << settings.lut.file << "\n";
        std::cout << "  Grid:     " << grid.nx() << " x " << grid.ny() << " x " << grid.nz()
                  << " nodes, spacing " << grid.spacing().x << " / " << grid.spacing().y
                  << " / " << grid.spacing().z << " km\n";
        std::cout << "  Stations: " << lut.stationCount() << "\n";
        std::cout << "  Phases:  ";
        for (PhaseType p : lut.phases()) std::cout << " " << phaseTypeToString(p);
        std::cout << "\n";
        std::cout << "  Model:    " << lut.velocityModelName() << "\n";
        std::cout << "  Max tt:   " << lut.maxTraveltime() << " s\n";
        std::cout << "  Memory:   " << lut.memoryBytes() / (1024.0 * 1024.0) << " MB\n";
    }

    if (!settings.output.database.empty()) {
        CatalogDatabase db;
        if (!db.open(settings.output.database)) {
            std::cerr << "Failed to open database: " << settings.output.database << std::endl;
            return 1;
        }
        std::cout << "Catalog " << settings.output.database << "\n";
        std::cout << "  Triggers: " << db.countTriggers() << "\n";
        std::cout << "  Events:   " << db.countEvents() << "\n";
        std::cout << "  Picks:    " << db.countPicks() << "\n";
        std::cout << "  Stamags:  " << db.countStationMagnitudes() << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    // Set up signal handlers
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    // Parse command line arguments
    std::string command;
    std::string config_file = "quakemigrate.conf";
    std::string start_text;
    std::string end_text;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file = argv[++i];
        } else if ((arg == "-s" || arg == "--start") && i + 1 < argc) {
            start_text = argv[++i];
        } else if ((arg == "-e" || arg == "--end") && i + 1 < argc) {
            end_text = argv[++i];
        } else if (command.empty() && arg[0] != '-') {
            command = arg;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    if (command != "lut" && command != "detect" && command != "trigger" &&
        command != "locate" && command != "info") {
        printUsage(argv[0]);
        return 1;
    }

    try {
        Config config;
        if (!config.loadFromFile(config_file)) {
            std::cerr << "Failed to load config: " << config_file << std::endl;
            return 1;
        }
        RunSettings settings = RunSettings::fromConfig(config);

        StationInventory inventory;
        if (!settings.input.stations.empty()) {
            if (!inventory.loadFromFile(settings.input.stations)) {
                std::cerr << "Failed to load stations: " << settings.input.stations << std::endl;
                return 1;
            }
        }
        ProjectionPtr projection;
        if (!inventory.empty()) {
            projection = makeProjection(settings, inventory);
            inventory.project(*projection);
        }

        auto archive = std::make_shared<MiniSeedArchive>(settings.input.archive);
        if (command == "detect" || command == "locate") {
            if (settings.input.archive.empty() || !archive->load()) {
                std::cerr << "Failed to load waveform archive: " << settings.input.archive
                          << std::endl;
                return 1;
            }
            std::cout << "Loaded " << archive->streamCount() << " streams from "
                      << settings.input.archive << std::endl;
        }

        QuakeScan scan(settings, inventory, archive);
        if (projection) scan.setProjection(projection);
        g_scan.store(&scan);

        int status = 0;
        if (command == "lut") {
            LookupTablePtr lut = scan.buildLut();
            if (!lut->save(settings.lut.file)) {
                std::cerr << "Failed to save LUT: " << settings.lut.file << std::endl;
                status = 1;
            } else {
                std::cout << "LUT saved to " << settings.lut.file << std::endl;
            }
        } else if (command == "info") {
            status = runInfo(scan, settings);
        } else {
            TimePoint start, end;
            if (!parseSpan(start_text, end_text, start, end) || !scan.loadLut()) {
                g_scan.store(nullptr);
                return 1;
            }
            if (command == "detect") {
                CoalescenceSeries series = scan.detect(start, end);
                std::cout << "Detect complete: " << series.size() << " ticks" << std::endl;
                if (scan.stopRequested()) status = 130;
            } else if (command == "trigger") {
                auto triggers = scan.trigger(start, end);
                std::cout << "Trigger complete: " << triggers.size() << " events" << std::endl;
            } else {
                auto events = scan.locate(start, end);
                std::cout << "Locate complete: " << events.size() << " events" << std::endl;
            }
        }

        g_scan.store(nullptr);
        return status;
    } catch (const Exception& e) {
        g_scan.store(nullptr);
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        g_scan.store(nullptr);
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 2;
    }
}
