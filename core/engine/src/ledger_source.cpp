#include "ledger/engine/ledger_source.hpp"

#include "ledger/codec/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>

namespace ledger {

namespace {

template <typename T>
std::vector<T> readArray(const nlohmann::json& doc, const char* key) {
  auto it = doc.find(key);
  if (it == doc.end() || it->is_null()) {
    return {};
  }
  return it->get<std::vector<T>>();
}

}  // namespace

JsonFileLedgerSource::JsonFileLedgerSource(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw std::runtime_error("cannot open ledger snapshot: " + path);
  }

  try {
    nlohmann::json doc = nlohmann::json::parse(in);
    batches_ = readArray<domain::StockBatch>(doc, "batches");
    adjustments_ = readArray<domain::Adjustment>(doc, "adjustments");
    allocations_ = readArray<domain::Allocation>(doc, "allocations");
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("malformed ledger snapshot " + path + ": " +
                             e.what());
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error("malformed ledger snapshot " + path + ": " +
                             e.what());
  }
}

}  // namespace ledger
