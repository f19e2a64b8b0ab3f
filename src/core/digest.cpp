// core/digest.cpp - SHA-256 file digests implementation
#include "digest.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <fstream>
#include <memory>
#include <mutex>
#include <openssl/evp.h>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace offload {

std::string sha256_file(const fs::path &path) {
  std::ifstream f(path, std::ios::binary);
  if (!f)
    throw std::runtime_error("open failed: " + path.string());

  struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
  };
  std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx)
    throw std::runtime_error("EVP_MD_CTX_new failed");
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }

  std::vector<unsigned char> buf(COPY_CHUNK_BYTES);
  while (f) {
    f.read(reinterpret_cast<char *>(buf.data()), buf.size());
    std::streamsize n = f.gcount();
    if (n > 0) {
      if (EVP_DigestUpdate(ctx.get(), buf.data(), (size_t)n) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
      }
    }
  }
  if (f.bad()) {
    throw std::runtime_error("read failed: " + path.string());
  }

  unsigned char out[EVP_MAX_MD_SIZE];
  unsigned int out_len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), out, &out_len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }

  std::string hex;
  hex.reserve(out_len * 2);
  for (unsigned int i = 0; i < out_len; i++) {
    hex += "0123456789abcdef"[out[i] >> 4];
    hex += "0123456789abcdef"[out[i] & 0x0F];
  }
  return hex;
}

RecordMap compute_records(const std::vector<MediaFile> &files, int workers) {
  std::vector<FileRecord> results(files.size());
  std::atomic<size_t> next{0};
  std::atomic<bool> failed{false};
  std::exception_ptr first_error;
  std::mutex error_mutex;

  auto worker = [&]() {
    while (!failed) {
      size_t i = next.fetch_add(1);
      if (i >= files.size())
        return;
      const auto &file = files[i];
      try {
        FileRecord rec;
        rec.relative = file.relative;
        rec.size = fs::file_size(file.absolute);
        rec.digest = sha256_file(file.absolute);
        results[i] = std::move(rec);
      } catch (const std::exception &e) {
        LOG_ERROR("Digest failed for " + file.absolute.string() + ": " +
                  e.what());
        std::lock_guard<std::mutex> lock(error_mutex);
        if (!first_error) {
          first_error = std::current_exception();
        }
        failed = true;
      }
    }
  };

  size_t pool_size = std::min<size_t>(std::max(workers, 1), files.size());
  std::vector<std::thread> pool;
  pool.reserve(pool_size);
  try {
    for (size_t i = 0; i < pool_size; ++i) {
      pool.emplace_back(worker);
    }
  } catch (const std::system_error &e) {
    // Stop the workers already running before reporting
    failed = true;
    for (auto &t : pool) {
      t.join();
    }
    throw std::runtime_error(std::string("cannot start digest workers: ") +
                             e.what());
  }
  for (auto &t : pool) {
    t.join();
  }

  if (first_error) {
    std::rethrow_exception(first_error);
  }

  RecordMap records;
  for (auto &rec : results) {
    std::string key = rec.relative;
    records.emplace(std::move(key), std::move(rec));
  }
  return records;
}

} // namespace offload
