/**
 * Arrow Utilities - Helpers for exporting engine results as Arrow tables
 *
 * Arrow reports failures through Status / Result values; these helpers turn
 * them into exceptions.
 */

#pragma once

#include <arrow/api.h>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace tkgstats {
namespace arrow_utils {

/**
 * Throw std::runtime_error if `status` is not OK
 *
 * @param status Arrow status
 * @param context What was being attempted (prefixed to the message)
 */
inline void check_status(const arrow::Status& status, const std::string& context) {
    if (!status.ok()) {
        throw std::runtime_error(context + ": " + status.ToString());
    }
}

/**
 * Copy a vector into a new Arrow int64 array (no nulls)
 *
 * The values are copied so the array does not depend on the lifetime of
 * the input vector.
 */
inline std::shared_ptr<arrow::Array> to_int64_array(const std::vector<int64_t>& values) {
    arrow::Int64Builder builder;
    check_status(builder.AppendValues(values), "Int64Builder::AppendValues");

    std::shared_ptr<arrow::Array> array;
    check_status(builder.Finish(&array), "Int64Builder::Finish");
    return array;
}

}  // namespace arrow_utils
}  // namespace tkgstats
