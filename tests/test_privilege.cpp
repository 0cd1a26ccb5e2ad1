#include "minitest.hpp"
#include "control/PrivilegeGate.hpp"
#include <string>

using puls::control::Capability;
using puls::control::PrivilegeGate;
using puls::model::SourceKind;

TEST(privilege_resolve) {
  ASSERT_TRUE(PrivilegeGate::resolve(true, false) == Capability::Full);
  ASSERT_TRUE(PrivilegeGate::resolve(false, false) == Capability::ReadOnly);
  // safe mode wins even for root
  ASSERT_TRUE(PrivilegeGate::resolve(true, true) == Capability::Safe);
  ASSERT_TRUE(PrivilegeGate::resolve(false, true) == Capability::Safe);
}

TEST(privilege_only_full_mutates) {
  ASSERT_TRUE(PrivilegeGate(Capability::Full).can_mutate());
  ASSERT_TRUE(!PrivilegeGate(Capability::ReadOnly).can_mutate());
  ASSERT_TRUE(!PrivilegeGate(Capability::Safe).can_mutate());
  ASSERT_TRUE(!PrivilegeGate().can_mutate());
}

TEST(privilege_safe_blocks_gpu_and_containers) {
  PrivilegeGate safe(Capability::Safe);
  ASSERT_TRUE(!safe.allows_source(SourceKind::Gpu));
  ASSERT_TRUE(!safe.allows_source(SourceKind::Container));
  ASSERT_TRUE(safe.allows_source(SourceKind::Host));
  ASSERT_TRUE(safe.allows_source(SourceKind::Process));

  PrivilegeGate ro(Capability::ReadOnly);
  ASSERT_TRUE(ro.allows_source(SourceKind::Gpu));
  ASSERT_TRUE(ro.allows_source(SourceKind::Container));
}

TEST(privilege_detect_with_safe_flag) {
  ASSERT_TRUE(PrivilegeGate::detect(true).capability() == Capability::Safe);
  auto c = PrivilegeGate::detect(false).capability();
  ASSERT_TRUE(c == Capability::Full || c == Capability::ReadOnly);
  ASSERT_EQ(std::string(puls::control::to_string(Capability::ReadOnly)), std::string("read-only"));
}
