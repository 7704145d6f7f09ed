#include "protocol/command.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <cstdint>
#include <limits>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace judgebox {
using namespace std;
using namespace nlohmann;

/**
 * @brief 读取文本字段，CBOR 的字节串按原样转换为字符串
 */
static string get_text(const json &j, const char *key) {
    const json &value = access(j, key);
    if (value.is_binary()) {
        auto &bytes = value.get_binary();
        return string(bytes.begin(), bytes.end());
    }
    return get_value<string>(j, key);
}

/**
 * @brief 读取无符号整数字段，拒绝浮点数、布尔值和超出 32 位的数
 * @throw protocol_error 若字段不是 [0, UINT32_MAX] 内的整数
 */
static int64_t get_uint32(const json &j, const char *key) {
    const json &value = access(j, key);
    if (!value.is_number_integer())
        throw protocol_error(fmt::format("Field {} must be an integer, got {}", key, value.type_name()));
    if (value.is_number_unsigned()) {
        auto number = value.get<uint64_t>();
        if (number > numeric_limits<uint32_t>::max())
            throw protocol_error(fmt::format("Field {} is too large: {}", key, number));
        return (int64_t)number;
    }
    auto number = value.get<int64_t>();
    if (number < 0)
        throw protocol_error(fmt::format("Field {} is negative: {}", key, number));
    if (number > (int64_t)numeric_limits<uint32_t>::max())
        throw protocol_error(fmt::format("Field {} is too large: {}", key, number));
    return number;
}

static test_command parse_test_command(const json &j) {
    test_command cmd;
    cmd.lang = language_from_ordinal(get_uint32(j, "language"));
    cmd.code = get_text(j, "code");
    cmd.tests = get_text(j, "tests");
    cmd.time_limit = get_uint32(j, "time_limit");
    if (exists(j, "memory_limit"))
        cmd.memory_limit = get_uint32(j, "memory_limit");
    if (exists(j, "custom_judger"))
        cmd.custom_judger = get_text(j, "custom_judger");
    return cmd;
}

command parse_command(const json &j) {
    try {
        if (!j.is_object())
            throw protocol_error("Command is not a map");

        string type = get_value<string>(j, "command");
        if (type == "Test") {
            return parse_test_command(j);
        } else if (type == "Versions") {
            return versions_command{};
        } else if (type == "ValidateJudger") {
            return validate_judger_command{get_text(j, "judger")};
        } else {
            throw protocol_error("Unknown command " + type);
        }
    } catch (invalid_argument &e) {
        throw protocol_error(e.what());
    }
}

command read_command(const filesystem::path &path) {
    string content = read_file_content(path);

    error_code ec;
    filesystem::remove(path, ec);
    if (ec) LOG(WARNING) << "Unable to remove command file " << path << ": " << ec.message();

    json j;
    try {
        j = json::from_cbor(content);
    } catch (json::parse_error &e) {
        throw protocol_error(fmt::format("Malformed command: {}", e.what()));
    }
    return parse_command(j);
}

}  // namespace judgebox
