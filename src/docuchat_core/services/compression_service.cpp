#include "docuchat_core/services/compression_service.hpp"

#include <zstd.h>

#include <memory>

#include "docuchat_core/errors.hpp"

namespace docuchat_core {

namespace {

struct CCtxDeleter {
  void operator()(ZSTD_CCtx *ctx) const {
    ZSTD_freeCCtx(ctx);
  }
};

struct DCtxDeleter {
  void operator()(ZSTD_DCtx *ctx) const {
    ZSTD_freeDCtx(ctx);
  }
};

void check_zstd(size_t code, const std::string &what) {
  if (ZSTD_isError(code)) {
    throw ChunkStoreError(what + ": " + ZSTD_getErrorName(code));
  }
}

}  // namespace

std::vector<char> CompressionService::compress(std::string_view text, int level) {
  if (text.empty()) {
    return {};
  }
  if (text.size() > kMaxDocumentBytes) {
    throw ChunkStoreError("Document body of " + std::to_string(text.size()) +
                          " bytes exceeds the storable maximum");
  }

  std::unique_ptr<ZSTD_CCtx, CCtxDeleter> ctx(ZSTD_createCCtx());
  if (!ctx) {
    throw ChunkStoreError("Failed to allocate zstd compression context");
  }
  check_zstd(ZSTD_CCtx_setParameter(ctx.get(), ZSTD_c_compressionLevel, level),
             "Invalid compression level " + std::to_string(level));
  check_zstd(ZSTD_CCtx_setParameter(ctx.get(), ZSTD_c_checksumFlag, 1),
             "Failed to enable frame checksum");

  std::vector<char> frame(ZSTD_compressBound(text.size()));
  const size_t written =
      ZSTD_compress2(ctx.get(), frame.data(), frame.size(), text.data(), text.size());
  check_zstd(written, "Failed to compress document body");
  frame.resize(written);
  return frame;
}

std::string CompressionService::decompress(const std::vector<char> &frame) {
  if (frame.empty()) {
    return "";
  }

  const unsigned long long declared = ZSTD_getFrameContentSize(frame.data(), frame.size());
  if (declared == ZSTD_CONTENTSIZE_ERROR || declared == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw ChunkStoreError("Stored document body is not a zstd frame");
  }
  if (declared > kMaxDocumentBytes) {
    throw ChunkStoreError("Stored document body declares " + std::to_string(declared) +
                          " bytes, more than any document can hold");
  }

  std::unique_ptr<ZSTD_DCtx, DCtxDeleter> ctx(ZSTD_createDCtx());
  if (!ctx) {
    throw ChunkStoreError("Failed to allocate zstd decompression context");
  }

  std::string text(static_cast<size_t>(declared), '\0');
  const size_t produced =
      ZSTD_decompressDCtx(ctx.get(), text.data(), text.size(), frame.data(), frame.size());
  check_zstd(produced, "Stored document body is corrupt");
  if (produced != text.size()) {
    throw ChunkStoreError("Stored document body decoded to " + std::to_string(produced) +
                          " bytes, expected " + std::to_string(declared));
  }
  return text;
}

}  // namespace docuchat_core
