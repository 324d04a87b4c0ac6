#include <qoikit/types.hpp>

namespace qoikit {

const char* to_string(codec_error err) noexcept {
    switch (err) {
        case codec_error::none:                return "none";
        case codec_error::invalid_magic:       return "invalid_magic";
        case codec_error::invalid_tag:         return "invalid_tag";
        case codec_error::invalid_data:        return "invalid_data";
        case codec_error::end_of_stream:       return "end_of_stream";
        case codec_error::out_of_memory:       return "out_of_memory";
        case codec_error::dimensions_exceeded: return "dimensions_exceeded";
        case codec_error::io_error:            return "io_error";
        case codec_error::invalid_state:       return "invalid_state";
    }
    return "unknown";
}

} // namespace qoikit
