#pragma once

#include "types.hpp"
#include "waveform.hpp"
#include <memory>
#include <string>

namespace quakemigrate {

/**
 * WaveformSource - Supplies the waveform segments covering a time span
 */
class WaveformSource {
public:
    virtual ~WaveformSource() = default;

    // Samples of every available stream inside [start, end]
    virtual WaveformMap read(TimePoint start, TimePoint end) = 0;
};

using WaveformSourcePtr = std::shared_ptr<WaveformSource>;

/**
 * MemoryArchive - Waveforms held in memory, one gap-filled segment per
 * stream
 */
class MemoryArchive : public WaveformSource {
public:
    MemoryArchive() = default;

    // Merges with any segment already held for the same stream
    void add(WaveformPtr waveform);

    size_t size() const { return waveforms_.size(); }
    const WaveformMap& waveforms() const { return waveforms_; }

    WaveformMap read(TimePoint start, TimePoint end) override;

private:
    WaveformMap waveforms_;
};

/**
 * MiniSeedArchive - Reads a MiniSEED file, or every file below a directory,
 * into memory
 */
class MiniSeedArchive : public WaveformSource {
public:
    explicit MiniSeedArchive(const std::string& path);

    bool load();
    size_t streamCount() const { return memory_.size(); }

    WaveformMap read(TimePoint start, TimePoint end) override;

private:
    std::string path_;
    MemoryArchive memory_;

    bool loadFile(const std::string& filename);
};

} // namespace quakemigrate
