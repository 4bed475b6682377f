#include "papertrade/storage/ledger_snapshot.hpp"

#include "papertrade/common/errors.hpp"
#include "papertrade/serialization/json_codec.hpp"
#include "papertrade/storage/ledger.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <iostream>

namespace papertrade {

void saveLedgerSnapshot(const Ledger& ledger, const std::string& path) {
  const LedgerState state = ledger.exportState();
  const nlohmann::json document = state;

  const std::string tmp_path = path + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out) {
      throw StorageUnavailableError("cannot write snapshot " + tmp_path);
    }
    out << document.dump(2) << "\n";
    if (!out.flush()) {
      throw StorageUnavailableError("short write on snapshot " + tmp_path);
    }
  }
  if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
    throw StorageUnavailableError("cannot replace snapshot " + path);
  }

  std::cout << "[LedgerSnapshot] saved " << state.accounts.size()
            << " account(s) to " << path << "\n";
}

bool loadLedgerSnapshot(Ledger& ledger, const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    std::cout << "[LedgerSnapshot] no snapshot at " << path << ", starting empty\n";
    return false;
  }

  LedgerState state;
  try {
    nlohmann::json document;
    in >> document;
    state = document.get<LedgerState>();
    ledger.importState(state);
  } catch (const nlohmann::json::exception& e) {
    throw StorageUnavailableError("corrupt snapshot " + path + ": " + e.what());
  } catch (const ValidationError& e) {
    throw StorageUnavailableError("corrupt snapshot " + path + ": " + e.what());
  }

  std::cout << "[LedgerSnapshot] restored " << state.accounts.size()
            << " account(s) from " << path << "\n";
  return true;
}

}  // namespace papertrade
