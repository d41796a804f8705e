#pragma once

#include "runguard_options.hpp"

/**
 * Create the control group with memory and cpu accounting controllers.
 * 
 * @return false if cgroups are unavailable (not mounted, no permission,
 *         no delegation). In that case the memory ceiling is enforced with
 *         RLIMIT_DATA and peak memory is taken from rusage.
 */
bool cgroup_create(const struct runguard_options &);

/**
 * Move current process to the control group.
 * 
 * Attach to the control group to change settings
 * and monitor status.
 */
void cgroup_attach(const struct runguard_options &);

/**
 * Kill all processes in the control group.
 * 
 * Here, runguard will kill all child processes of
 * the monitored process after exiting.
 */
void cgroup_kill(const struct runguard_options &);

void cgroup_delete(const struct runguard_options &);

/**
 * Detach runguard from the host namespaces before forking the command:
 * PID, IPC, UTS, network and mount namespaces. An unprivileged runguard first
 * enters a new user namespace with an identity uid/gid mapping.
 * 
 * The forked command becomes the init process of the new PID namespace,
 * when it exits the kernel kills every process left in the namespace.
 * 
 * @return false if namespaces could not be created
 */
bool isolate_namespaces();

/**
 * Build a minimal root filesystem on opt.rootfs and pivot_root into it.
 * 
 * System directories (/usr, /bin, /lib*, /opt) and a few files of /etc are
 * bind mounted read-only, /tmp is a private tmpfs, /dev only holds null,
 * zero, full, random and urandom. The working directory is the only host
 * directory mounted writable, at the same path as outside.
 * 
 * @throw std::system_error if the root could not be prepared, the process
 *        still sees the host filesystem in that case
 * @throw std::runtime_error if the old root could not be detached after pivot_root
 */
void setup_filesystem(const struct runguard_options &opt);

/**
 * Limit current process resources usage.
 * 
 * @return false if opt.rootfs is set but the filesystem could not be restricted
 */
bool set_restrictions(const struct runguard_options &opt);

/**
 * Refuse socket() for every address family except AF_UNIX.
 * 
 * @return false if the filter could not be loaded
 */
bool set_seccomp(const struct runguard_options &opt);
