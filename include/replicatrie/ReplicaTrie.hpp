#pragma once

#include "clock/VectorClock.hpp"
#include "codec/ValueCodec.hpp"
#include "container/Container.hpp"
#include "core/Error.hpp"
#include "history/ContainerHistory.hpp"
#include "merge/MergeEngine.hpp"
#include "merge/MergeOptions.hpp"
#include "persistent/PersistentArray.hpp"
#include "serialization/ContainerCodec.hpp"
#include "trie/Node.hpp"
#include "trie/Trie.hpp"
