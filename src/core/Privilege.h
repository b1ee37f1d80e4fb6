// Linux privilege & sandbox helpers (best-effort; compile-time gated)
#pragma once
namespace conn_tracker {
// Both act on the calling thread. Call them before any other thread is
// started; threads created afterwards inherit the result.
void drop_capabilities(bool keep_cap_dac);
// allow_network adds the socket syscalls the Kafka client threads need.
bool apply_seccomp_profile(bool allow_network);
bool is_privilege_available();
bool is_seccomp_available();
}
