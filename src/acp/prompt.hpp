#pragma once

#include <string>
#include <vector>

#include "core/types.hpp"
#include "pi/pi_process.hpp"

namespace piacp::acp {

struct PiPrompt {
  std::string message;
  std::vector<PiImage> images;
};

// Flatten ACP content blocks into pi's {message, images} shape.
//
//   text           appended verbatim
//   resource_link  "\n[Context] <uri>"
//   resource       "\n[Embedded Context] <uri> (<mime>)\n<text>", or a byte count for blobs
//   audio          "\n[Audio] (<mime>, N bytes) not supported by pi-acp"
//   image          moved to `images`, never inlined
//
// Unknown block types are dropped.
PiPrompt prompt_to_pi_message(const json& blocks);

// Decoded size of a base64 payload, without decoding it
size_t base64_decoded_size(const std::string& data);

}  // namespace piacp::acp
