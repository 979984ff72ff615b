#include "model/catalog.hpp"

#include <array>
#include <utility>

namespace hvstat::model {
namespace {

struct KvmCounterDef {
  const char* name;
  const char* description;
  const char* group;
};

constexpr std::array<KvmCounterDef, 32> kKvmCounters{{
    {"exits", "VM exits", "kvm_exits"},
    {"io_exits", "VM exits on port I/O", "kvm_exits"},
    {"mmio_exits", "VM exits on MMIO access", "kvm_exits"},
    {"halt_exits", "VM exits on HLT", "kvm_exits"},
    {"irq_exits", "VM exits on external interrupt", "kvm_exits"},
    {"signal_exits", "VM exits on pending host signal", "kvm_exits"},
    {"request_irq_exits", "VM exits to request an interrupt window", "kvm_exits"},
    {"irq_window_exits", "VM exits on interrupt window", "kvm_exits"},
    {"nmi_window_exits", "VM exits on NMI window", "kvm_exits"},
    {"halt_wakeup", "vCPU wakeups from halt", "kvm_exits"},
    {"mmu_cache_miss", "MMU shadow page cache misses", "kvm_mmu"},
    {"mmu_flooded", "MMU shadow pages zapped by write flooding", "kvm_mmu"},
    {"mmu_pde_zapped", "MMU page directory entries zapped", "kvm_mmu"},
    {"mmu_pte_updated", "MMU page table entries updated", "kvm_mmu"},
    {"mmu_pte_write", "MMU page table entry writes", "kvm_mmu"},
    {"mmu_recycled", "MMU shadow pages recycled", "kvm_mmu"},
    {"mmu_shadow_zapped", "MMU shadow pages zapped", "kvm_mmu"},
    {"mmu_unsync", "MMU unsynced shadow pages", "kvm_mmu"},
    {"remote_tlb_flush", "remote TLB flushes", "kvm_tlb"},
    {"tlb_flush", "TLB flushes", "kvm_tlb"},
    {"invlpg", "guest INVLPG instructions", "kvm_tlb"},
    {"pf_fixed", "page faults fixed by the host", "kvm_paging"},
    {"pf_guest", "page faults reflected to the guest", "kvm_paging"},
    {"largepages", "large pages in use", "kvm_paging"},
    {"fpu_reload", "FPU state reloads", "kvm_reload"},
    {"host_state_reload", "host state reloads", "kvm_reload"},
    {"efer_reload", "EFER register reloads", "kvm_reload"},
    {"insn_emulation", "instructions emulated", "kvm_emulation"},
    {"insn_emulation_fail", "instruction emulation failures", "kvm_emulation"},
    {"hypercalls", "hypercalls", "kvm_emulation"},
    {"irq_injections", "interrupts injected", "kvm_irq"},
    {"nmi_injections", "NMIs injected", "kvm_irq"},
}};

}  // namespace

Catalog::Catalog()
    : intr("intr", "interrupts", {"cpu"}),
      ctxt("ctxt", "context switches", {"cpu"}),
      cpu_nice("cpu_nice", "CPU ticks in niced user mode", {"cpu"}),
      cpu_system("cpu_system", "CPU ticks in system mode", {"cpu"}),
      cpu_idle("cpu_idle", "CPU ticks idle", {"cpu"}),
      cpu_iowait("cpu_iowait", "CPU ticks waiting for I/O", {"cpu"}),
      pgfault("pgfault", "page faults", {"memory"}),
      disk_read_sectors("disk_read_sectors", "sectors read", {"disk"}),
      disk_write_sectors("disk_write_sectors", "sectors written", {"disk"}),
      net_rx_bytes("net_rx_bytes", "bytes received", {"net"}),
      net_tx_bytes("net_tx_bytes", "bytes transmitted", {"net"}) {
  kvm_.reserve(kKvmCounters.size());
  for (const auto& entry : kKvmCounters) {
    auto counter = std::make_unique<Counter>(entry.name, std::string{"KVM "} + entry.description);
    counter->add_tag("kvm");
    counter->add_tag(entry.group);
    kvm_.push_back(std::move(counter));
  }
}

const Catalog& catalog() {
  static const Catalog kCatalog{};
  return kCatalog;
}

}  // namespace hvstat::model
