/*
  Trail-coverage determines which trail segments were covered by GPS tracks.
  Copyright (C) 2018  Florian Barth

  This program is free software: you can redistribute it and/or modify
  it under the terms of the GNU General Public License as published by
  the Free Software Foundation, either version 3 of the License, or
  (at your option) any later version.

  This program is distributed in the hope that it will be useful,
  but WITHOUT ANY WARRANTY; without even the implied warranty of
  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
  GNU General Public License for more details.

  You should have received a copy of the GNU General Public License
  along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/
#ifndef CACHE_H
#define CACHE_H

#include "geometry.hpp"
#include "namedType.hpp"

#include <atomic>
#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/container_hash/hash.hpp>
#include <boost/filesystem.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <boost/serialization/string.hpp>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

using Fingerprint = NamedType<uint64_t, struct FingerprintParameter>;

std::string to_hex(Fingerprint fingerprint);

// Deterministic content hash of cache inputs.
class FingerprintBuilder {
  public:
  template <typename T> FingerprintBuilder& add(const T& value)
  {
    boost::hash_combine(seed, value);
    return *this;
  }

  FingerprintBuilder& add(Fingerprint fingerprint);
  FingerprintBuilder& add(const Coordinate& c);
  FingerprintBuilder& add(const std::vector<Coordinate>& path);

  Fingerprint finish() const;

  private:
  size_t seed = 0;
};

// Storage behind a Cache. Implementations must be safe to call from several threads.
class CacheStore {
  public:
  virtual ~CacheStore() noexcept = default;

  virtual std::optional<std::string> read(const std::string& key) = 0;
  virtual void write(const std::string& key, const std::string& bytes) = 0;
  virtual void clear() = 0;
};

// Never hits.
class NullCacheStore : public CacheStore {
  public:
  std::optional<std::string> read(const std::string& key) override;
  void write(const std::string& key, const std::string& bytes) override;
  void clear() override;
};

class MemoryCacheStore : public CacheStore {
  public:
  std::optional<std::string> read(const std::string& key) override;
  void write(const std::string& key, const std::string& bytes) override;
  void clear() override;

  size_t size();
  std::vector<std::string> keys();

  private:
  std::mutex key_;
  std::unordered_map<std::string, std::string> entries;
};

/*
  One file per entry below `directory`. Entries are written to a unique temporary file which is
  renamed over the target, so readers never see a partially written entry.
*/
class FileCacheStore : public CacheStore {
  public:
  explicit FileCacheStore(boost::filesystem::path directory);

  std::optional<std::string> read(const std::string& key) override;
  void write(const std::string& key, const std::string& bytes) override;
  void clear() override;

  boost::filesystem::path pathOf(const std::string& key) const;

  private:
  boost::filesystem::path directory;
};

/*
  Memoizes artifacts in a CacheStore. Payloads are gzip compressed boost binary archives that
  start with their own kind and fingerprint. Unreadable, truncated or mismatching payloads count
  as corrupt and are recomputed, failed writes are reported and ignored.
*/
class Cache {
  public:
  explicit Cache(std::shared_ptr<CacheStore> store);
  Cache(const Cache& other) = delete;
  Cache& operator=(const Cache& other) = delete;
  virtual ~Cache() noexcept = default;

  template <typename T, typename Compute>
  T getOrCompute(const std::string& kind, Fingerprint key, Compute compute);

  // Drops every stored entry.
  void invalidate();

  size_t hits() const;
  size_t misses() const;
  size_t corrupt() const;

  static std::string entryKey(const std::string& kind, Fingerprint key);

  template <typename T> static std::string encode(const T& value, const std::string& kind, Fingerprint key);
  template <typename T> static T decode(const std::string& bytes, const std::string& kind, Fingerprint key);

  private:
  std::shared_ptr<CacheStore> store;
  std::atomic<size_t> hits_{ 0 };
  std::atomic<size_t> misses_{ 0 };
  std::atomic<size_t> corrupt_{ 0 };
};

template <typename T>
std::string Cache::encode(const T& value, const std::string& kind, Fingerprint key)
{
  namespace iostr = boost::iostreams;

  std::ostringstream compressed{ std::ios::binary };
  {
    iostr::filtering_ostream out;
    out.push(iostr::gzip_compressor());
    out.push(compressed);
    {
      boost::archive::binary_oarchive oa{ out };
      std::string storedKind = kind;
      uint64_t storedKey = key.get();
      oa << storedKind << storedKey << value;
    }
    out.reset();
  }
  return compressed.str();
}

template <typename T>
T Cache::decode(const std::string& bytes, const std::string& kind, Fingerprint key)
{
  namespace iostr = boost::iostreams;

  std::istringstream compressed{ bytes, std::ios::binary };
  iostr::filtering_istream in;
  in.push(iostr::gzip_decompressor());
  in.push(compressed);

  boost::archive::binary_iarchive ia{ in };
  std::string storedKind;
  uint64_t storedKey = 0;
  ia >> storedKind >> storedKey;
  if (storedKind != kind || storedKey != key.get()) {
    throw std::runtime_error("entry was written for " + storedKind + "-"
        + to_hex(Fingerprint{ storedKey }));
  }
  T value{};
  ia >> value;
  return value;
}

template <typename T, typename Compute>
T Cache::getOrCompute(const std::string& kind, Fingerprint key, Compute compute)
{
  const auto entry = entryKey(kind, key);
  auto bytes = store->read(entry);
  if (bytes) {
    try {
      T value = decode<T>(*bytes, kind, key);
      ++hits_;
      return value;
    } catch (std::exception& e) {
      ++corrupt_;
      std::cerr << "Warning: recomputing corrupt cache entry " << entry << ": " << e.what()
                << '\n';
    }
  }
  ++misses_;

  T value = compute();
  try {
    store->write(entry, encode(value, kind, key));
  } catch (std::exception& e) {
    std::cerr << "Warning: could not write cache entry " << entry << ": " << e.what() << '\n';
  }
  return value;
}

#endif /* CACHE_H */
