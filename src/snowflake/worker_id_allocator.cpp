#include "flakeid/snowflake/worker_id_allocator.h"

#include "flakeid/core/hashing.h"

#include <unistd.h>

#include <array>
#include <bit>
#include <cerrno>
#include <cstring>

namespace flakeid::snowflake {

namespace {

using AllocResult = core::Result<std::uint32_t, core::ConfigError>;

AllocResult out_of_range(const std::string& what, const std::int64_t value,
                         const std::uint64_t max_value) {
  return AllocResult::err(core::ConfigError{what + " " + std::to_string(value) +
                                            " is out of range [0, " + std::to_string(max_value) +
                                            "]"});
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// StaticWorkerIdAllocator
// ────────────────────────────────────────────────────────────────

AllocResult StaticWorkerIdAllocator::allocate(const std::uint32_t max_worker_id) const {
  if (worker_id_ < 0 || static_cast<std::uint64_t>(worker_id_) > max_worker_id) {
    return out_of_range("worker id", worker_id_, max_worker_id);
  }
  return AllocResult::ok(static_cast<std::uint32_t>(worker_id_));
}

std::string StaticWorkerIdAllocator::describe() const {
  return "static (" + std::to_string(worker_id_) + ")";
}

// ────────────────────────────────────────────────────────────────
// HostnameWorkerIdAllocator
// ────────────────────────────────────────────────────────────────

core::Result<std::string, core::ConfigError> HostnameWorkerIdAllocator::resolve_hostname() const {
  using R = core::Result<std::string, core::ConfigError>;
  if (hostname_.has_value()) {
    if (hostname_->empty()) {
      return R::err(core::ConfigError{"hostname must not be empty"});
    }
    return R::ok(*hostname_);
  }

  // POSIX caps hostnames at HOST_NAME_MAX (255 on Linux); reserve room for the terminator.
  std::array<char, 256> buffer{};
  if (::gethostname(buffer.data(), buffer.size() - 1) != 0) {
    return R::err(core::ConfigError{std::string("gethostname failed: ") + std::strerror(errno)});
  }
  std::string name(buffer.data());
  if (name.empty()) {
    return R::err(core::ConfigError{"local hostname is empty"});
  }
  return R::ok(std::move(name));
}

AllocResult HostnameWorkerIdAllocator::allocate(const std::uint32_t max_worker_id) const {
  auto host = resolve_hostname();
  if (!host.has_value()) {
    return AllocResult::err(host.error());
  }
  const std::uint64_t space = static_cast<std::uint64_t>(max_worker_id) + 1;
  return AllocResult::ok(static_cast<std::uint32_t>(core::fnv1a_64(host.value()) % space));
}

std::string HostnameWorkerIdAllocator::describe() const {
  return "hostname (" + hostname_.value_or("<local>") + ")";
}

// ────────────────────────────────────────────────────────────────
// ProcessIdWorkerIdAllocator
// ────────────────────────────────────────────────────────────────

ProcessIdWorkerIdAllocator::ProcessIdWorkerIdAllocator() : pid_(static_cast<std::int64_t>(::getpid())) {}

AllocResult ProcessIdWorkerIdAllocator::allocate(const std::uint32_t max_worker_id) const {
  if (pid_ < 0) {
    return AllocResult::err(core::ConfigError{"process id must be >= 0 (got " +
                                              std::to_string(pid_) + ")"});
  }
  const std::uint64_t space = static_cast<std::uint64_t>(max_worker_id) + 1;
  return AllocResult::ok(static_cast<std::uint32_t>(static_cast<std::uint64_t>(pid_) % space));
}

std::string ProcessIdWorkerIdAllocator::describe() const {
  return "pid (" + std::to_string(pid_) + ")";
}

// ────────────────────────────────────────────────────────────────
// DatacenterWorkerIdAllocator
// ────────────────────────────────────────────────────────────────

AllocResult DatacenterWorkerIdAllocator::allocate(const std::uint32_t max_worker_id) const {
  // max_worker_id is always 2^worker_bits - 1, so its bit width is the field width.
  const int worker_bits = std::bit_width(max_worker_id);
  if (datacenter_bits_ < 1 || datacenter_bits_ >= worker_bits) {
    return AllocResult::err(core::ConfigError{
        "datacenter bits must be in [1, " + std::to_string(worker_bits - 1) + "] (got " +
        std::to_string(datacenter_bits_) + ")"});
  }

  const int node_bits = worker_bits - datacenter_bits_;
  const std::uint64_t max_datacenter = (std::uint64_t{1} << datacenter_bits_) - 1;
  const std::uint64_t max_node = (std::uint64_t{1} << node_bits) - 1;

  if (datacenter_id_ < 0 || static_cast<std::uint64_t>(datacenter_id_) > max_datacenter) {
    return out_of_range("datacenter id", datacenter_id_, max_datacenter);
  }
  if (node_id_ < 0 || static_cast<std::uint64_t>(node_id_) > max_node) {
    return out_of_range("node id", node_id_, max_node);
  }

  return AllocResult::ok(static_cast<std::uint32_t>(
      (static_cast<std::uint64_t>(datacenter_id_) << node_bits) |
      static_cast<std::uint64_t>(node_id_)));
}

std::string DatacenterWorkerIdAllocator::describe() const {
  return "datacenter (" + std::to_string(datacenter_id_) + "/" + std::to_string(node_id_) + ", " +
         std::to_string(datacenter_bits_) + " datacenter bits)";
}

}  // namespace flakeid::snowflake
