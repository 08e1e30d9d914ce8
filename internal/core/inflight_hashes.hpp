#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace registry::core {

/*
  Content hashes with a publish in flight.

  A publish registers its declared hash before reserving the catalog slot
  and keeps it registered until the entry is committed or abandoned. The
  garbage collector deletes a blob only through RunIfIdle(), which holds the
  registry lock, so a blob cannot disappear between a publisher's promote
  and its commit.
*/
class InflightHashes {
 public:
  class Guard {
   public:
    Guard(InflightHashes* owner, std::string hash);
    ~Guard();

    Guard(Guard&& other) noexcept;
    Guard(const Guard&)            = delete;
    Guard& operator=(const Guard&) = delete;
    Guard& operator=(Guard&&)      = delete;

   private:
    InflightHashes* owner_;
    std::string     hash_;
  };

  Guard Register(const std::string& hash);

  bool Contains(const std::string& hash) const;

  /*
    Runs fn with the registry locked unless hash is registered.
    Returns false without calling fn when the hash is in flight.
  */
  bool RunIfIdle(const std::string& hash, const std::function<void()>& fn);

 private:
  void Release(const std::string& hash);

  mutable std::mutex                        mutex_;
  std::unordered_map<std::string, uint32_t> counts_;
};

} // namespace registry::core
