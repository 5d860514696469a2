#ifndef AIRBEACON_STATE_RECORD_H
#define AIRBEACON_STATE_RECORD_H

#include <stdint.h>
#include <cstddef>
#include <string>
#include <vector>

// State file written by the AirPlay server and polled by the beacon daemon.
//
//   offset 0  len 2   port (uint16, little-endian)
//   offset 2  len 4   owner pid (uint32, little-endian)
//   offset 6  ..EOF   owner executable path, UTF-8, NUL-terminated or
//                     running to end of file; bytes after the first NUL
//                     are ignored
#define STATE_RECORD_PORT_OFFSET 0
#define STATE_RECORD_PID_OFFSET 2
#define STATE_RECORD_PATH_OFFSET 6
#define STATE_RECORD_MIN_SIZE 6

namespace airbeacon {

enum class DecodeError : uint8_t
{
    NONE = 0,
    TOO_SHORT = 1,
    INVALID_UTF8 = 2
};

inline const char* decode_error_to_string(DecodeError error) {
    switch (error) {
        case DecodeError::NONE: return "none";
        case DecodeError::TOO_SHORT: return "record shorter than 6 bytes";
        case DecodeError::INVALID_UTF8: return "executable path is not valid UTF-8";
    }
    return "unknown";
}

struct StateRecord {
    uint16_t port = 0;
    uint32_t owner_pid = 0;
    std::string owner_executable_path;

    // Last path component; this is what gets matched against the live
    // process name.
    std::string owner_executable_name() const {
        size_t slash = owner_executable_path.find_last_of('/');
        if (slash == std::string::npos) {
            return owner_executable_path;
        }
        return owner_executable_path.substr(slash + 1);
    }

    bool operator==(const StateRecord& other) const {
        return port == other.port &&
               owner_pid == other.owner_pid &&
               owner_executable_path == other.owner_executable_path;
    }

    bool operator!=(const StateRecord& other) const {
        return !(*this == other);
    }
};

class StateRecordCodec {
public:
    static bool decode(const uint8_t* buffer, size_t length, StateRecord& record,
                       DecodeError* error = nullptr) {
        if (length < STATE_RECORD_MIN_SIZE) {
            set_error(error, DecodeError::TOO_SHORT);
            return false;
        }

        uint16_t port = (uint16_t)buffer[0] | ((uint16_t)buffer[1] << 8);
        uint32_t pid = (uint32_t)buffer[2] | ((uint32_t)buffer[3] << 8) |
                       ((uint32_t)buffer[4] << 16) | ((uint32_t)buffer[5] << 24);

        const uint8_t* path = buffer + STATE_RECORD_PATH_OFFSET;
        size_t path_length = 0;
        size_t available = length - STATE_RECORD_PATH_OFFSET;
        while (path_length < available && path[path_length] != 0) {
            path_length++;
        }

        if (!is_valid_utf8(path, path_length)) {
            set_error(error, DecodeError::INVALID_UTF8);
            return false;
        }

        record.port = port;
        record.owner_pid = pid;
        record.owner_executable_path.assign(reinterpret_cast<const char*>(path), path_length);
        set_error(error, DecodeError::NONE);
        return true;
    }

    static bool decode(const std::vector<uint8_t>& buffer, StateRecord& record,
                       DecodeError* error = nullptr) {
        return decode(buffer.data(), buffer.size(), record, error);
    }

    static std::vector<uint8_t> encode(const StateRecord& record) {
        std::vector<uint8_t> buffer(STATE_RECORD_MIN_SIZE + record.owner_executable_path.size() + 1);
        buffer[0] = record.port & 0xFF;
        buffer[1] = (record.port >> 8) & 0xFF;
        buffer[2] = record.owner_pid & 0xFF;
        buffer[3] = (record.owner_pid >> 8) & 0xFF;
        buffer[4] = (record.owner_pid >> 16) & 0xFF;
        buffer[5] = (record.owner_pid >> 24) & 0xFF;
        for (size_t i = 0; i < record.owner_executable_path.size(); i++) {
            buffer[STATE_RECORD_PATH_OFFSET + i] = (uint8_t)record.owner_executable_path[i];
        }
        buffer.back() = 0;
        return buffer;
    }

    // Strict RFC 3629 check: no overlongs, no surrogates, nothing past U+10FFFF.
    static bool is_valid_utf8(const uint8_t* data, size_t length) {
        size_t i = 0;
        while (i < length) {
            uint8_t c = data[i];
            if (c < 0x80) {
                i++;
                continue;
            }

            size_t extra;
            uint32_t code_point;
            uint32_t minimum;
            if ((c & 0xE0) == 0xC0) {
                extra = 1;
                code_point = c & 0x1F;
                minimum = 0x80;
            } else if ((c & 0xF0) == 0xE0) {
                extra = 2;
                code_point = c & 0x0F;
                minimum = 0x800;
            } else if ((c & 0xF8) == 0xF0) {
                extra = 3;
                code_point = c & 0x07;
                minimum = 0x10000;
            } else {
                return false;
            }

            if (i + extra >= length) {
                return false;
            }
            for (size_t k = 1; k <= extra; k++) {
                uint8_t cont = data[i + k];
                if ((cont & 0xC0) != 0x80) {
                    return false;
                }
                code_point = (code_point << 6) | (cont & 0x3F);
            }

            if (code_point < minimum || code_point > 0x10FFFF ||
                (code_point >= 0xD800 && code_point <= 0xDFFF)) {
                return false;
            }
            i += extra + 1;
        }
        return true;
    }

private:
    static void set_error(DecodeError* error, DecodeError value) {
        if (error) {
            *error = value;
        }
    }
};

} // namespace airbeacon

#endif // AIRBEACON_STATE_RECORD_H
