#include "FrameDecoder.hpp"

#include <array>

#include <spdlog/spdlog.h>

namespace {
// Trailer of an empty stored block; the server strips it from every frame.
constexpr std::array<unsigned char, 4> kSyncSuffix = {0x00, 0x00, 0xff, 0xff};
constexpr int kRawDeflateWindowBits = -15;
}  // namespace

FrameDecoder::FrameDecoder() {
  reset();
}

FrameDecoder::~FrameDecoder() {
  if (ready_) {
    inflateEnd(&stream_);
  }
}

void FrameDecoder::reset() {
  if (ready_) {
    inflateEnd(&stream_);
    ready_ = false;
  }
  stream_ = z_stream{};
  const int rc = inflateInit2(&stream_, kRawDeflateWindowBits);
  if (rc != Z_OK) {
    spdlog::error("inflateInit2 failed: {}", rc);
    return;
  }
  ready_ = true;
}

std::vector<ServerMessage> FrameDecoder::decodeBinary(const std::string& frame) {
  std::string text;
  if (!inflateFrame(frame, text)) {
    return {};
  }
  return parseEnvelope(text);
}

std::vector<ServerMessage> FrameDecoder::decodeText(const std::string& frame) {
  return parseEnvelope(frame);
}

bool FrameDecoder::inflateFrame(const std::string& frame, std::string& out) {
  if (!ready_) {
    return false;
  }
  std::string input = frame;
  input.append(reinterpret_cast<const char*>(kSyncSuffix.data()), kSyncSuffix.size());

  stream_.next_in = reinterpret_cast<Bytef*>(input.data());
  stream_.avail_in = static_cast<uInt>(input.size());

  std::array<char, 16384> chunk{};
  do {
    stream_.next_out = reinterpret_cast<Bytef*>(chunk.data());
    stream_.avail_out = static_cast<uInt>(chunk.size());
    const int rc = inflate(&stream_, Z_SYNC_FLUSH);
    if (rc != Z_OK && rc != Z_BUF_ERROR && rc != Z_STREAM_END) {
      spdlog::debug("inflate failed on {} byte frame: {} ({})", frame.size(), rc,
                    stream_.msg != nullptr ? stream_.msg : "no message");
      return false;
    }
    out.append(chunk.data(), chunk.size() - stream_.avail_out);
    if (rc == Z_STREAM_END || (rc == Z_BUF_ERROR && stream_.avail_out != 0)) {
      break;
    }
  } while (stream_.avail_out == 0 || stream_.avail_in > 0);

  return true;
}
