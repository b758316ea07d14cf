#include "bitwire/serialize.hpp"

#include "bitwire/core/log.hpp"

namespace bitwire::detail {

std::error_code finish_decode(const BitBuffer& buf, std::error_code ec, const DecodeOptions& options) {
  if (!ec && !options.allow_trailing_bytes && buf.remaining_bits() >= 8) {
    ec = make_error_code(errc::trailing_data);
  }
  if (ec) {
    core::detail::log_decode_failure(ec, buf.read_position(), buf.bit_size());
  }
  return ec;
}

}  // namespace bitwire::detail
