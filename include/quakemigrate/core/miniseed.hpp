#pragma once

#include "types.hpp"
#include "waveform.hpp"
#include <cstdint>

namespace quakemigrate {

/**
 * MiniSeedRecord - One SEED data record (fixed header, blockette 1000,
 * decoded samples)
 */
class MiniSeedRecord {
public:
    static constexpr size_t FIXED_HEADER_SIZE = 48;

    // Data encoding types
    enum class Encoding : uint8_t {
        ASCII = 0,
        INT16 = 1,
        INT24 = 2,
        INT32 = 3,
        FLOAT32 = 4,
        FLOAT64 = 5,
        STEIM1 = 10,
        STEIM2 = 11
    };

    MiniSeedRecord() : sample_rate_(0), sample_count_(0),
                       record_length_(512), encoding_(Encoding::STEIM2),
                       big_endian_(true) {}

    // Parse the record starting at data; length is the number of bytes
    // available. Returns false if the bytes are not a decodable record.
    bool parse(const uint8_t* data, size_t length);

    // Accessors
    const StreamID& streamId() const { return stream_id_; }
    TimePoint startTime() const { return start_time_; }
    double sampleRate() const { return sample_rate_; }
    size_t sampleCount() const { return sample_count_; }
    size_t recordLength() const { return record_length_; }
    Encoding encoding() const { return encoding_; }
    const SampleVector& samples() const { return samples_; }

private:
    StreamID stream_id_;
    TimePoint start_time_;
    double sample_rate_;
    size_t sample_count_;
    size_t record_length_;
    Encoding encoding_;
    bool big_endian_;
    SampleVector samples_;

    uint16_t read16(const uint8_t* p) const;
    uint32_t read32(const uint8_t* p) const;

    bool decodeSteimData(const uint8_t* data, size_t length, int steim_level);
    bool decodeIntegerData(const uint8_t* data, size_t length, int bytes);
    bool decodeFloatData(const uint8_t* data, size_t length, int bytes);

    // BTIME structure
    TimePoint parseTime(const uint8_t* btime) const;
};

/**
 * MiniSeedReader - Read MiniSEED files into merged waveforms
 */
class MiniSeedReader {
public:
    MiniSeedReader() = default;

    // Read from file
    bool open(const std::string& filename);

    // Read from memory
    bool parse(const uint8_t* data, size_t length);

    const std::vector<MiniSeedRecord>& records() const { return records_; }

    // One waveform per stream; gaps between records are filled with NaN
    std::vector<WaveformPtr> toWaveforms() const;

private:
    std::vector<MiniSeedRecord> records_;
};

} // namespace quakemigrate
