#include "quakemigrate/core/miniseed.hpp"
#include <fstream>
#include <cmath>
#include <iterator>
#include <limits>
#include <cstring>
#include <ctime>
#include <cctype>
#include <iostream>
#include <algorithm>
#include <map>

namespace quakemigrate {

namespace {

int32_t signExtend(uint32_t value, int bits) {
    uint32_t shift = 32 - bits;
    return static_cast<int32_t>(value << shift) >> shift;
}

std::string trimmed(const uint8_t* p, size_t n) {
    std::string s(reinterpret_cast<const char*>(p), n);
    size_t first = s.find_first_not_of(" \0", 0, 2);
    if (first == std::string::npos) return std::string();
    size_t last = s.find_last_not_of(" \0", std::string::npos, 2);
    return s.substr(first, last - first + 1);
}

} // namespace

uint16_t MiniSeedRecord::read16(const uint8_t* p) const {
    return big_endian_ ? static_cast<uint16_t>((p[0] << 8) | p[1])
                       : static_cast<uint16_t>((p[1] << 8) | p[0]);
}

uint32_t MiniSeedRecord::read32(const uint8_t* p) const {
    if (big_endian_) {
        return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
               (static_cast<uint32_t>(p[2]) << 8) | p[3];
    }
    return (static_cast<uint32_t>(p[3]) << 24) | (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[1]) << 8) | p[0];
}

TimePoint MiniSeedRecord::parseTime(const uint8_t* btime) const {
    // year (2), day of year (2), hour, minute, second, unused, 0.0001 s (2)
    uint16_t year = read16(btime);
    uint16_t doy = read16(btime + 2);
    uint8_t hour = btime[4];
    uint8_t min = btime[5];
    uint8_t sec = btime[6];
    uint16_t frac = read16(btime + 8);

    std::tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = 0;
    tm.tm_mday = 1;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;

    // timegm normalises day-of-month overflow, so the day of year can be
    // added to January 1st directly
    std::time_t t = timegm(&tm) + static_cast<std::time_t>(doy - 1) * 86400;
    return std::chrono::system_clock::from_time_t(t) +
           std::chrono::duration_cast<TimePoint::duration>(Duration(frac * 100));
}

bool MiniSeedRecord::parse(const uint8_t* data, size_t length) {
    if (length < FIXED_HEADER_SIZE) return false;

    // Sequence number: digits, spaces or NULs
    for (int i = 0; i < 6; i++) {
        if (!std::isdigit(data[i]) && data[i] != ' ' && data[i] != 0) return false;
    }

    // Data quality indicator (D, R, Q, M)
    char quality = static_cast<char>(data[6]);
    if (quality != 'D' && quality != 'R' && quality != 'Q' && quality != 'M') {
        return false;
    }

    // Header byte order from the plausibility of the year
    big_endian_ = true;
    uint16_t year = read16(data + 20);
    if (year < 1900 || year > 2100) {
        big_endian_ = false;
        year = read16(data + 20);
        if (year < 1900 || year > 2100) return false;
    }

    stream_id_.station = trimmed(data + 8, 5);
    stream_id_.location = trimmed(data + 13, 2);
    stream_id_.channel = trimmed(data + 15, 3);
    stream_id_.network = trimmed(data + 18, 2);

    start_time_ = parseTime(data + 20);
    sample_count_ = read16(data + 30);

    double factor = static_cast<int16_t>(read16(data + 32));
    double multiplier = static_cast<int16_t>(read16(data + 34));
    if (factor > 0 && multiplier > 0) {
        sample_rate_ = factor * multiplier;
    } else if (factor > 0 && multiplier < 0) {
        sample_rate_ = -factor / multiplier;
    } else if (factor < 0 && multiplier > 0) {
        sample_rate_ = -multiplier / factor;
    } else if (factor < 0 && multiplier < 0) {
        sample_rate_ = 1.0 / (factor * multiplier);
    } else {
        sample_rate_ = 0;
    }

    uint8_t activity = data[36];
    uint8_t num_blockettes = data[39];
    int32_t time_correction = static_cast<int32_t>(read32(data + 40));
    uint16_t data_offset = read16(data + 44);
    uint16_t blockette_offset = read16(data + 46);

    // Time correction applies unless the header says it already has been
    if ((activity & 0x02) == 0 && time_correction != 0) {
        start_time_ += std::chrono::duration_cast<TimePoint::duration>(
            Duration(static_cast<int64_t>(time_correction) * 100));
    }

    // Blockette 1000 carries encoding, word order and record length
    bool have_b1000 = false;
    bool data_big_endian = big_endian_;
    uint16_t offset = blockette_offset;
    for (int n = 0; n < num_blockettes && offset >= FIXED_HEADER_SIZE && offset + 8 <= length; n++) {
        const uint8_t* bp = data + offset;
        uint16_t type = read16(bp);
        uint16_t next = read16(bp + 2);

        if (type == 1000) {
            encoding_ = static_cast<Encoding>(bp[4]);
            data_big_endian = bp[5] != 0;
            record_length_ = static_cast<size_t>(1) << bp[6];
            have_b1000 = true;
        }

        if (next == 0 || next <= offset) break;
        offset = next;
    }

    if (!have_b1000) {
        record_length_ = 512;
        encoding_ = Encoding::STEIM2;
    }
    big_endian_ = data_big_endian;
    if (record_length_ < 128 || record_length_ > length) return false;
    if (sample_count_ == 0) {
        samples_.clear();
        return true;
    }
    if (data_offset < FIXED_HEADER_SIZE || data_offset >= record_length_ || sample_rate_ <= 0) {
        return false;
    }

    const uint8_t* dp = data + data_offset;
    size_t data_len = record_length_ - data_offset;

    switch (encoding_) {
        case Encoding::STEIM1:
            return decodeSteimData(dp, data_len, 1);
        case Encoding::STEIM2:
            return decodeSteimData(dp, data_len, 2);
        case Encoding::INT16:
            return decodeIntegerData(dp, data_len, 2);
        case Encoding::INT32:
            return decodeIntegerData(dp, data_len, 4);
        case Encoding::FLOAT32:
            return decodeFloatData(dp, data_len, 4);
        case Encoding::FLOAT64:
            return decodeFloatData(dp, data_len, 8);
        default:
            std::cerr << "MiniSEED: unsupported encoding " << static_cast<int>(encoding_)
                      << " in " << stream_id_.toString() << std::endl;
            return false;
    }
}

bool MiniSeedRecord::decodeSteimData(const uint8_t* data, size_t length, int steim_level) {
    samples_.clear();
    if (length < 64) return false;

    // Frames of 16 32-bit words, the first word of each holding 2-bit
    // descriptors for all 16. Frame 0 words 1 and 2 are the integration
    // constants X0 and Xn.
    std::vector<int32_t> diffs;
    diffs.reserve(sample_count_);
    int32_t x0 = 0;
    int32_t xn = 0;

    size_t num_frames = length / 64;
    for (size_t frame = 0; frame < num_frames && diffs.size() < sample_count_; frame++) {
        const uint8_t* fp = data + frame * 64;
        uint32_t ctrl = read32(fp);

        for (int word = 1; word < 16 && diffs.size() < sample_count_; word++) {
            uint32_t w = read32(fp + word * 4);
            int nibble = (ctrl >> (30 - 2 * word)) & 0x03;

            if (frame == 0 && word == 1) {
                x0 = static_cast<int32_t>(w);
                continue;
            }
            if (frame == 0 && word == 2) {
                xn = static_cast<int32_t>(w);
                continue;
            }

            if (nibble == 0) continue;

            if (nibble == 1) {
                for (int i = 0; i < 4; i++) diffs.push_back(signExtend((w >> (24 - 8 * i)) & 0xFF, 8));
            } else if (steim_level == 1) {
                if (nibble == 2) {
                    for (int i = 0; i < 2; i++) diffs.push_back(signExtend((w >> (16 - 16 * i)) & 0xFFFF, 16));
                } else {
                    diffs.push_back(static_cast<int32_t>(w));
                }
            } else {
                int dnib = (w >> 30) & 0x03;
                if (nibble == 2) {
                    if (dnib == 1) {
                        diffs.push_back(signExtend(w & 0x3FFFFFFF, 30));
                    } else if (dnib == 2) {
                        for (int i = 0; i < 2; i++) diffs.push_back(signExtend((w >> (15 - 15 * i)) & 0x7FFF, 15));
                    } else if (dnib == 3) {
                        for (int i = 0; i < 3; i++) diffs.push_back(signExtend((w >> (20 - 10 * i)) & 0x3FF, 10));
                    } else {
                        return false;
                    }
                } else {
                    if (dnib == 0) {
                        for (int i = 0; i < 5; i++) diffs.push_back(signExtend((w >> (24 - 6 * i)) & 0x3F, 6));
                    } else if (dnib == 1) {
                        for (int i = 0; i < 6; i++) diffs.push_back(signExtend((w >> (25 - 5 * i)) & 0x1F, 5));
                    } else if (dnib == 2) {
                        for (int i = 0; i < 7; i++) diffs.push_back(signExtend((w >> (24 - 4 * i)) & 0x0F, 4));
                    } else {
                        return false;
                    }
                }
            }
        }
    }

    if (diffs.size() < sample_count_) return false;

    // The first difference refers to the previous record and is superseded by X0
    samples_.resize(sample_count_);
    int32_t x = x0;
    samples_[0] = x;
    for (size_t i = 1; i < sample_count_; i++) {
        x += diffs[i];
        samples_[i] = x;
    }

    if (x != xn) {
        std::cerr << "MiniSEED: Steim integration check failed for "
                  << stream_id_.toString() << " (" << x << " != " << xn << ")" << std::endl;
    }
    return true;
}

bool MiniSeedRecord::decodeIntegerData(const uint8_t* data, size_t length, int bytes) {
    samples_.clear();
    if (sample_count_ * bytes > length) return false;
    samples_.reserve(sample_count_);

    for (size_t i = 0; i < sample_count_; i++) {
        const uint8_t* p = data + i * bytes;
        if (bytes == 2) {
            samples_.push_back(static_cast<int16_t>(read16(p)));
        } else {
            samples_.push_back(static_cast<int32_t>(read32(p)));
        }
    }
    return true;
}

bool MiniSeedRecord::decodeFloatData(const uint8_t* data, size_t length, int bytes) {
    samples_.clear();
    if (sample_count_ * bytes > length) return false;
    samples_.reserve(sample_count_);

    for (size_t i = 0; i < sample_count_; i++) {
        const uint8_t* p = data + i * bytes;
        if (bytes == 4) {
            uint32_t bits = read32(p);
            float val;
            std::memcpy(&val, &bits, sizeof(float));
            samples_.push_back(val);
        } else {
            uint64_t hi = read32(big_endian_ ? p : p + 4);
            uint64_t lo = read32(big_endian_ ? p + 4 : p);
            uint64_t bits = (hi << 32) | lo;
            double val;
            std::memcpy(&val, &bits, sizeof(double));
            samples_.push_back(val);
        }
    }
    return true;
}

// MiniSeedReader implementation
bool MiniSeedReader::open(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "Failed to open MiniSEED file: " << filename << std::endl;
        return false;
    }

    std::vector<uint8_t> buffer((std::istreambuf_iterator<char>(file)),
                                std::istreambuf_iterator<char>());
    if (!parse(buffer.data(), buffer.size())) {
        std::cerr << "No MiniSEED records decoded from " << filename << std::endl;
        return false;
    }
    return true;
}

bool MiniSeedReader::parse(const uint8_t* data, size_t length) {
    records_.clear();

    size_t offset = 0;
    size_t skipped = 0;
    while (offset + MiniSeedRecord::FIXED_HEADER_SIZE <= length) {
        MiniSeedRecord record;
        if (record.parse(data + offset, length - offset)) {
            offset += record.recordLength();
            if (record.sampleCount() > 0) records_.push_back(std::move(record));
        } else {
            // Resynchronise on the smallest legal record boundary
            offset += 128;
            skipped++;
        }
    }

    if (skipped > 0) {
        std::cerr << "MiniSEED: skipped " << skipped << " undecodable blocks" << std::endl;
    }
    return !records_.empty();
}

std::vector<WaveformPtr> MiniSeedReader::toWaveforms() const {
    std::map<StreamID, std::vector<const MiniSeedRecord*>> grouped;
    for (const auto& rec : records_) {
        grouped[rec.streamId()].push_back(&rec);
    }

    std::vector<WaveformPtr> result;
    for (auto& [id, recs] : grouped) {
        std::stable_sort(recs.begin(), recs.end(),
            [](const MiniSeedRecord* a, const MiniSeedRecord* b) {
                return a->startTime() < b->startTime();
            });

        WaveformPtr wf;
        for (const MiniSeedRecord* rec : recs) {
            Waveform segment(id, rec->sampleRate(), rec->startTime());
            segment.append(rec->samples());

            // A sample rate change starts a new waveform
            if (!wf || !wf->merge(segment)) {
                wf = std::make_shared<Waveform>(segment);
                result.push_back(wf);
            }
        }
    }
    return result;
}

} // namespace quakemigrate
