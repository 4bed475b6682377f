#pragma once

#include <string>

namespace papertrade {

class Ledger;

// -----------------------------------------------------------------------------
// Ledger snapshots
// -----------------------------------------------------------------------------
// The ledger is written as one JSON document (see LedgerState) to a sibling
// temporary file and renamed over the target, so a crash mid-write leaves
// the previous snapshot intact.
//
// loadLedgerSnapshot() returns false when the file does not exist, which is
// the normal first start. Unreadable or malformed files raise
// StorageUnavailableError; the daemon refuses to start on top of a snapshot
// it cannot read rather than silently resetting balances.
// -----------------------------------------------------------------------------
void saveLedgerSnapshot(const Ledger& ledger, const std::string& path);

bool loadLedgerSnapshot(Ledger& ledger, const std::string& path);

}  // namespace papertrade
