#ifndef QOIKIT_QOIKIT_HPP_
#define QOIKIT_QOIKIT_HPP_

#include <qoikit/qoikit_export.h>
#include <qoikit/types.hpp>
#include <qoikit/image.hpp>
#include <qoikit/header.hpp>
#include <qoikit/color_cache.hpp>
#include <qoikit/opcodes.hpp>
#include <qoikit/stream.hpp>
#include <qoikit/encoder.hpp>
#include <qoikit/decoder.hpp>

namespace qoikit {

// All public API is included via the headers above.
// See:
//   - types.hpp:       color, channel_format, colorspace, codec_error, codec_result, decode_options
//   - image.hpp:       image, image_view
//   - header.hpp:      container layout constants, header codec
//   - color_cache.hpp: color_hash, color_cache
//   - opcodes.hpp:     opcode tags and the per-pixel encode/decode steps
//   - stream.hpp:      byte_source, byte_sink and their memory/iostream implementations
//   - encoder.hpp:     stream_encoder, encode()
//   - decoder.hpp:     stream_decoder, decode(), is_valid_container()

} // namespace qoikit

#endif // QOIKIT_QOIKIT_HPP_
