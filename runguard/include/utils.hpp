#pragma once

#include <string>

bool is_number(const std::string &s);

/**
 * @brief 根据用户名查找 uid
 * @return 用户不存在时返回 -1
 */
int get_userid(const char *name);

/**
 * @brief 根据用户组名查找 gid
 * @return 用户组不存在时返回 -1
 */
int get_groupid(const char *name);

/**
 * @brief 查找用户的主用户组
 * @return 用户不存在时返回 -1
 */
int get_user_groupid(int uid);
