#pragma once

#include <nlohmann/json.hpp>
#include "protocol/command.hpp"

namespace judgebox {

/**
 * @brief 处理 Test 命令，参见 run_tests
 */
nlohmann::json do_test(const test_command &cmd);

/**
 * @brief 处理 Versions 命令
 * @return 按语言编号顺序排列的版本信息列表，任何一个版本查询失败时返回 { "Err": 原因 }
 */
nlohmann::json do_versions(const versions_command &cmd);

/**
 * @brief 处理 ValidateJudger 命令
 * @return { "Ok": null } 或者 { "Err": 原因 }
 */
nlohmann::json do_validate_judger(const validate_judger_command &cmd);

/**
 * @brief 根据命令类型分派给对应的处理函数
 * 处理函数不会抛出异常，所有错误都体现在返回的响应中
 */
nlohmann::json handle(const command &cmd);

}  // namespace judgebox
