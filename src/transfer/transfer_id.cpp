#include "transfer/transfer_id.h"

#include <cstdio>

#include "common/crypto/random.h"

namespace blobxfer::transfer {

TransferId generate_transfer_id() {
  TransferId id;
  do {
    for (auto& word : id.words) {
      word = crypto::random_uint32();
    }
  } while (id.is_zero());
  return id;
}

std::string to_string(const TransferId& id) {
  char buf[36];
  std::snprintf(buf, sizeof(buf), "%08X-%08X-%08X-%08X", id.words[0], id.words[1], id.words[2],
                id.words[3]);
  return buf;
}

}  // namespace blobxfer::transfer
