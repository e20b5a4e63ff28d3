#include "quakemigrate/core/archive.hpp"
#include "quakemigrate/core/miniseed.hpp"
#include <filesystem>
#include <iostream>

namespace quakemigrate {

void MemoryArchive::add(WaveformPtr waveform) {
    if (!waveform) return;
    auto it = waveforms_.find(waveform->streamId());
    if (it == waveforms_.end()) {
        waveforms_[waveform->streamId()] = waveform;
        return;
    }
    auto merged = std::make_shared<Waveform>(*it->second);
    if (merged->merge(*waveform)) {
        it->second = merged;
    } else {
        std::cerr << "MemoryArchive: sample rate change in "
                  << waveform->streamId().toString() << ", keeping the later segment" << std::endl;
        it->second = waveform;
    }
}

WaveformMap MemoryArchive::read(TimePoint start, TimePoint end) {
    WaveformMap result;
    for (const auto& [id, wf] : waveforms_) {
        if (wf->sampleCount() == 0 || wf->endTime() < start || wf->startTime() > end) continue;
        auto segment = std::make_shared<Waveform>(wf->slice(start, end));
        if (segment->sampleCount() > 0) {
            result[id] = segment;
        }
    }
    return result;
}

MiniSeedArchive::MiniSeedArchive(const std::string& path) : path_(path) {}

bool MiniSeedArchive::loadFile(const std::string& filename) {
    MiniSeedReader reader;
    if (!reader.open(filename)) return false;

    for (const auto& wf : reader.toWaveforms()) {
        memory_.add(wf);
    }
    return true;
}

bool MiniSeedArchive::load() {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (fs::is_directory(path_, ec)) {
        size_t loaded = 0;
        for (const auto& entry : fs::recursive_directory_iterator(path_, ec)) {
            if (!entry.is_regular_file()) continue;
            if (loadFile(entry.path().string())) loaded++;
        }
        if (ec) {
            std::cerr << "MiniSeedArchive: error scanning " << path_ << ": "
                      << ec.message() << std::endl;
            return false;
        }
        std::cout << "MiniSeedArchive: " << loaded << " files, "
                  << memory_.size() << " streams from " << path_ << std::endl;
        return loaded > 0;
    }

    if (!fs::exists(path_, ec)) {
        std::cerr << "MiniSeedArchive: no such file or directory: " << path_ << std::endl;
        return false;
    }
    return loadFile(path_);
}

WaveformMap MiniSeedArchive::read(TimePoint start, TimePoint end) {
    return memory_.read(start, end);
}

} // namespace quakemigrate
