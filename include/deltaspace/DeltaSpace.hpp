#pragma once

#include "core/Error.hpp"
#include "history/Delta.hpp"
#include "history/HistoryLedger.hpp"
#include "history/Notifier.hpp"
#include "history/PatchApplier.hpp"
#include "history/PatchCodec.hpp"
#include "history/TreeDiff.hpp"
#include "history/VersionedStore.hpp"
#include "tree/Node.hpp"
#include "tree/NodeJson.hpp"
#include "tree/Path.hpp"

namespace DS {

using History::VersionedStore;
using History::StoreOptions;
using History::HistoryTransaction;

} // namespace DS
