#pragma once

#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace judgebox {

/**
 * @brief { "Ok": payload }
 */
nlohmann::json ok_response(const nlohmann::json &payload);

/**
 * @brief { "Err": message }，用于 ValidateJudger 和 Versions
 */
nlohmann::json err_response(const std::string &message);

/**
 * @brief { "InvalidProgram": message }，用于 Test
 */
nlohmann::json invalid_program_response(const std::string &message);

/**
 * @brief 将响应编码为 CBOR 并一次性写入输出流
 * @throw std::system_error 若写入失败
 */
void write_response(std::ostream &os, const nlohmann::json &response);

}  // namespace judgebox
