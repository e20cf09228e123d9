#pragma once

#include <beacon/schema/encoding/scale/encoder.hpp>
#include <beacon/storage/rocksdb/storage.hpp>

namespace beacon::execution {

using encoder_t = beacon::schema::encoding::encoder<
    beacon::schema::encoding::scale_encoder_tag>;
using storage_t =
    beacon::storage::storage<beacon::storage::rocksdb_storage_tag>;
using write_batch_t = beacon::storage::write_batch;

}  // namespace beacon::execution
