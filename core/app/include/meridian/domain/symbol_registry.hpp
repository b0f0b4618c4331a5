#pragma once

#include "meridian/domain/instrument.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace meridian::domain {

// -----------------------------------------------------------------------------
// SymbolRegistry: immutable ticker -> Instrument lookup
// -----------------------------------------------------------------------------
//
// @brief  Owns every configured Instrument and hands out shared, const
//         references to it.
//
// @details
// Populated once at start-up (add() validates and rejects duplicates) and read
// concurrently afterwards. No mutation happens after the engine starts, so
// reads take no lock.
//
// Thread model: add() on the constructing thread only; find()/at()/all() from
//               any thread once construction is complete.
// -----------------------------------------------------------------------------
class SymbolRegistry {
 public:
  SymbolRegistry() = default;
  explicit SymbolRegistry(const std::vector<Instrument>& instruments);

  // Validates and stores the instrument. Throws ConfigError on an invalid
  // definition or a ticker that is already registered.
  void add(Instrument instrument);

  // nullptr when the ticker is unknown.
  std::shared_ptr<const Instrument> find(const std::string& ticker) const;

  // Throws LedgerError when the ticker is unknown.
  const Instrument& at(const std::string& ticker) const;

  bool contains(const std::string& ticker) const;

  std::vector<std::shared_ptr<const Instrument>> all() const;

  std::size_t size() const { return instruments_.size(); }

 private:
  std::unordered_map<std::string, std::shared_ptr<const Instrument>>
      instruments_;
};

}  // namespace meridian::domain
