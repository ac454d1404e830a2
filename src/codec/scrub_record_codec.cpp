#include "codec/scrub_record_codec.hpp"

#include <format>

namespace textscrub {

Result<std::string> ScrubRecordCodec::encode(const ScrubResult& record) {
    std::string buffer;
    const auto ec = glz::write_json(record, buffer);
    if (ec) {
        return Result<std::string>::error(ErrorCategory::INTERNAL_ERROR,
            std::format("Failed to encode scrub record: {}", glz::format_error(ec, buffer)));
    }
    return Result<std::string>::ok(std::move(buffer));
}

Result<ScrubResult> ScrubRecordCodec::decode(std::string_view json) {
    // glaze wants a null-terminated buffer
    const std::string buffer(json);
    ScrubResult record;
    const auto ec = glz::read_json(record, buffer);
    if (ec) {
        return Result<ScrubResult>::error(ErrorCategory::INVALID_REQUEST,
            std::format("Malformed scrub record: {}", glz::format_error(ec, buffer)));
    }
    return Result<ScrubResult>::ok(std::move(record));
}

} // namespace textscrub
