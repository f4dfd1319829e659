#pragma once

#include "flakeid/core/result.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace flakeid::snowflake {

// Abstract worker-id allocator for dependency injection.
// Derives or validates the worker identity of a generator from an external assignment or
// a local environment signal. Uniqueness across hosts is the deployment's responsibility:
// derived ids are deterministic but can collide.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IWorkerIdAllocator {
 public:
  virtual ~IWorkerIdAllocator() = default;

  // Return a worker id in [0, max_worker_id] or a ConfigError.
  [[nodiscard]] virtual core::Result<std::uint32_t, core::ConfigError> allocate(
      std::uint32_t max_worker_id) const = 0;

  // Short human-readable description of the signal, for startup diagnostics.
  [[nodiscard]] virtual std::string describe() const = 0;

  // True when the id comes from a local signal rather than an operator assignment.
  [[nodiscard]] virtual bool is_derived() const = 0;

 protected:
  IWorkerIdAllocator() = default;
  IWorkerIdAllocator(const IWorkerIdAllocator&) = default;
  IWorkerIdAllocator& operator=(const IWorkerIdAllocator&) = default;
  IWorkerIdAllocator(IWorkerIdAllocator&&) = default;
  IWorkerIdAllocator& operator=(IWorkerIdAllocator&&) = default;
};

// Operator-assigned worker id. Rejects ids outside the worker space instead of wrapping.
class StaticWorkerIdAllocator final : public IWorkerIdAllocator {
 public:
  explicit StaticWorkerIdAllocator(std::int64_t worker_id) : worker_id_(worker_id) {}

  [[nodiscard]] core::Result<std::uint32_t, core::ConfigError> allocate(
      std::uint32_t max_worker_id) const override;
  [[nodiscard]] std::string describe() const override;
  [[nodiscard]] bool is_derived() const override { return false; }

 private:
  std::int64_t worker_id_;
};

// Hostname hash (FNV-1a 64) modulo the worker space.
// With no hostname supplied, the local hostname is read at allocate() time.
class HostnameWorkerIdAllocator final : public IWorkerIdAllocator {
 public:
  HostnameWorkerIdAllocator() = default;
  explicit HostnameWorkerIdAllocator(std::string hostname) : hostname_(std::move(hostname)) {}

  [[nodiscard]] core::Result<std::uint32_t, core::ConfigError> allocate(
      std::uint32_t max_worker_id) const override;
  [[nodiscard]] std::string describe() const override;
  [[nodiscard]] bool is_derived() const override { return true; }

 private:
  [[nodiscard]] core::Result<std::string, core::ConfigError> resolve_hostname() const;

  std::optional<std::string> hostname_;
};

// Process id modulo the worker space. Only distinct among processes on one host.
class ProcessIdWorkerIdAllocator final : public IWorkerIdAllocator {
 public:
  ProcessIdWorkerIdAllocator();
  explicit ProcessIdWorkerIdAllocator(std::int64_t pid) : pid_(pid) {}

  [[nodiscard]] core::Result<std::uint32_t, core::ConfigError> allocate(
      std::uint32_t max_worker_id) const override;
  [[nodiscard]] std::string describe() const override;
  [[nodiscard]] bool is_derived() const override { return true; }

 private:
  std::int64_t pid_;
};

// Splits the worker field into | datacenter_bits | node bits |, with the datacenter id in
// the high part. With a 10-bit worker field and datacenter_bits = 5 this is the classic
// 32 datacenters x 32 nodes layout.
class DatacenterWorkerIdAllocator final : public IWorkerIdAllocator {
 public:
  static constexpr int kDefaultDatacenterBits = 5;

  DatacenterWorkerIdAllocator(std::int64_t datacenter_id, std::int64_t node_id,
                              int datacenter_bits = kDefaultDatacenterBits)
      : datacenter_id_(datacenter_id), node_id_(node_id), datacenter_bits_(datacenter_bits) {}

  [[nodiscard]] core::Result<std::uint32_t, core::ConfigError> allocate(
      std::uint32_t max_worker_id) const override;
  [[nodiscard]] std::string describe() const override;
  [[nodiscard]] bool is_derived() const override { return false; }

 private:
  std::int64_t datacenter_id_;
  std::int64_t node_id_;
  int datacenter_bits_;
};

}  // namespace flakeid::snowflake
