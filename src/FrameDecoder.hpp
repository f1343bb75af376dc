#pragma once

#include <string>
#include <vector>

#include <zlib.h>

#include "Protocol.hpp"

// Decodes webtiles frames. The server compresses all binary frames with one
// raw deflate stream that is flushed but never finished, so the inflater has
// to live as long as the connection and see every frame in order.
class FrameDecoder {
 public:
  FrameDecoder();
  ~FrameDecoder();

  FrameDecoder(const FrameDecoder&) = delete;
  FrameDecoder& operator=(const FrameDecoder&) = delete;

  std::vector<ServerMessage> decodeBinary(const std::string& frame);
  std::vector<ServerMessage> decodeText(const std::string& frame);

  // Starts a fresh stream, for a new connection.
  void reset();

 private:
  bool inflateFrame(const std::string& frame, std::string& out);

  z_stream stream_{};
  bool ready_ = false;
};
