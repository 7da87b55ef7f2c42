#pragma once

#include <sys/types.h>
#include <optional>
#include <vector>

/**
 * 通过 /proc 查询和终止选手程序的进程树
 */
namespace grader::sandbox {

struct process_info {
    pid_t pid;
    pid_t ppid;
    pid_t pgrp;

    /**
     * @brief 常驻内存页数
     */
    long rss_pages;
};

/**
 * @brief 读取 /proc/<pid>/stat
 * @return 进程不存在或者已经退出时为空
 */
std::optional<process_info> read_process_info(pid_t pid);

/**
 * @brief 列出系统中所有可见的进程
 */
std::vector<process_info> list_processes();

/**
 * @brief 找出 root 及其全部后代进程，以及进程组 pgid 中的所有进程
 */
std::vector<pid_t> collect_process_tree(pid_t root, pid_t pgid);

/**
 * @brief 进程树的常驻内存总量，单位为字节
 */
long long process_tree_memory(pid_t root, pid_t pgid);

/**
 * @brief 向整个进程组以及进程树中的所有进程发送 SIGKILL
 * 选手程序可能通过 setsid 脱离进程组，因此还需要按父子关系查找后代进程
 */
void kill_process_tree(pid_t root, pid_t pgid);

}  // namespace grader::sandbox
