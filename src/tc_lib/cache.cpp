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
#include "cache.hpp"

#include <fstream>
#include <iomanip>

namespace fs = boost::filesystem;

namespace {
const std::string ENTRY_EXTENSION = ".bin";
const std::string TEMP_EXTENSION = ".tmp";
}

std::string to_hex(Fingerprint fingerprint)
{
  std::ostringstream ss;
  ss << std::hex << std::setw(16) << std::setfill('0') << fingerprint.get();
  return ss.str();
}

FingerprintBuilder& FingerprintBuilder::add(Fingerprint fingerprint)
{
  boost::hash_combine(seed, fingerprint.get());
  return *this;
}

FingerprintBuilder& FingerprintBuilder::add(const Coordinate& c)
{
  boost::hash_combine(seed, c.lat.get());
  boost::hash_combine(seed, c.lng.get());
  return *this;
}

FingerprintBuilder& FingerprintBuilder::add(const std::vector<Coordinate>& path)
{
  boost::hash_combine(seed, path.size());
  for (const auto& c : path) {
    add(c);
  }
  return *this;
}

Fingerprint FingerprintBuilder::finish() const { return Fingerprint{ static_cast<uint64_t>(seed) }; }

std::optional<std::string> NullCacheStore::read(const std::string& /*key*/) { return {}; }
void NullCacheStore::write(const std::string& /*key*/, const std::string& /*bytes*/) {}
void NullCacheStore::clear() {}

std::optional<std::string> MemoryCacheStore::read(const std::string& key)
{
  std::lock_guard guard(key_);
  auto it = entries.find(key);
  if (it == entries.end()) {
    return {};
  }
  return it->second;
}

void MemoryCacheStore::write(const std::string& key, const std::string& bytes)
{
  std::lock_guard guard(key_);
  entries[key] = bytes;
}

void MemoryCacheStore::clear()
{
  std::lock_guard guard(key_);
  entries.clear();
}

size_t MemoryCacheStore::size()
{
  std::lock_guard guard(key_);
  return entries.size();
}

std::vector<std::string> MemoryCacheStore::keys()
{
  std::lock_guard guard(key_);
  std::vector<std::string> result;
  for (const auto& entry : entries) {
    result.push_back(entry.first);
  }
  return result;
}

FileCacheStore::FileCacheStore(fs::path directory)
    : directory(std::move(directory))
{
}

fs::path FileCacheStore::pathOf(const std::string& key) const
{
  return directory / (key + ENTRY_EXTENSION);
}

std::optional<std::string> FileCacheStore::read(const std::string& key)
{
  boost::system::error_code ec;
  const auto path = pathOf(key);
  if (!fs::is_regular_file(path, ec)) {
    return {};
  }

  std::ifstream in{ path.string(), std::ios::binary };
  if (!in) {
    return {};
  }
  std::ostringstream bytes;
  bytes << in.rdbuf();
  if (in.bad()) {
    return {};
  }
  return bytes.str();
}

void FileCacheStore::write(const std::string& key, const std::string& bytes)
{
  fs::create_directories(directory);
  const auto target = pathOf(key);
  const auto temp = directory / fs::unique_path(key + "-%%%%-%%%%-%%%%" + TEMP_EXTENSION);

  {
    std::ofstream out{ temp.string(), std::ios::binary | std::ios::trunc };
    out.write(bytes.data(), bytes.size());
    out.close();
    if (!out) {
      boost::system::error_code ec;
      fs::remove(temp, ec);
      throw std::runtime_error("failed to write " + temp.string());
    }
  }
  fs::rename(temp, target);
}

void FileCacheStore::clear()
{
  boost::system::error_code ec;
  if (!fs::is_directory(directory, ec)) {
    return;
  }
  std::vector<fs::path> entries;
  fs::directory_iterator it{ directory, ec };
  for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
    const auto extension = it->path().extension().string();
    if (extension == ENTRY_EXTENSION || extension == TEMP_EXTENSION) {
      entries.push_back(it->path());
    }
  }
  if (ec) {
    std::cerr << "could not list cache directory " << directory.string() << ": " << ec.message()
              << '\n';
  }

  size_t removed = 0;
  for (const auto& path : entries) {
    boost::system::error_code removeError;
    if (fs::remove(path, removeError)) {
      ++removed;
    } else if (removeError) {
      std::cerr << "could not remove cache entry " << path.string() << ": "
                << removeError.message() << '\n';
    }
  }
  std::cout << "..."
            << "removed " << removed << " of " << entries.size() << " cache entries from "
            << directory.string() << '\n';
}

Cache::Cache(std::shared_ptr<CacheStore> store)
    : store(std::move(store))
{
  if (!this->store) {
    throw std::invalid_argument("Cache needs a store");
  }
}

void Cache::invalidate() { store->clear(); }

size_t Cache::hits() const { return hits_; }
size_t Cache::misses() const { return misses_; }
size_t Cache::corrupt() const { return corrupt_; }

std::string Cache::entryKey(const std::string& kind, Fingerprint key)
{
  return kind + "-" + to_hex(key);
}
