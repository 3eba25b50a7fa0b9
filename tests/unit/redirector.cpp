/* Unit tests for the redirection installer.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <criterion/criterion.h>

#include <wanem/kernel/tc.hpp>
#include <wanem/provisioner.hpp>
#include <wanem/redirector.hpp>
#include <wanem/router/exceptions.hpp>

#include "fake_facility.hpp"

using namespace wanem;
using namespace wanem::router;
using namespace wanem::test;

// cppcheck-suppress unknownMacro
TestSuite(redirector, .description = "Redirection installer");

class Fixture {

public:
  FakeFacility f;
  VirtualTargetProvisioner p;
  RedirectionInstaller r;

  PhysicalInterface eth0;
  VirtualTarget vt;

  Fixture() : p(f), r(f), eth0{"eth0", "", 0} {
    f.addDevice("eth0");
    f.addDevice("eth1");

    vt = p.ensure(eth0);
  }
};

Test(redirector, rule_id) {
  FakeFacility f;
  RedirectionInstaller r(f);

  PhysicalInterface eth0{"eth0", "", 0};
  PhysicalInterface eth1{"eth1", "", 1};

  auto id0 = r.getRuleId(eth0);
  auto id1 = r.getRuleId(eth1);

  // Stable
  cr_assert(id0 == r.getRuleId(eth0));
  cr_assert(id0 != id1);

  cr_assert_eq(id0.prio, DEFAULT_REDIRECT_PRIO);
  cr_assert_eq(TC_U32_USERHTID(id0.handle), kernel::tc::U32_DEFAULT_HTID);
  cr_assert_neq(TC_U32_NODE(id0.handle), 0);
}

Test(redirector, install) {
  Fixture x;

  x.r.install(x.eth0, x.vt);

  auto cp = x.f.getCapturePoint("eth0");
  cr_assert(cp.has_value());
  cr_assert_str_eq(cp->kind.c_str(), "ingress");

  auto rules = x.f.getRules("eth0");
  cr_assert_eq(rules.size(), 1);
  cr_assert(rules[0].id == x.r.getRuleId(x.eth0));
  cr_assert(rules[0].matchAll);
  cr_assert_eq(rules[0].redirectIfindex, x.f.getLink("ifb0")->ifindex);

  cr_assert(x.r.inspect(x.eth0, x.vt) == RedirectionStatus::INSTALLED);

  // Other interfaces are not touched
  cr_assert_not(x.f.getCapturePoint("eth1").has_value());
}

Test(redirector, idempotent) {
  Fixture x;

  x.r.install(x.eth0, x.vt);

  auto mutations = x.f.mutations;

  x.r.install(x.eth0, x.vt);

  cr_assert_eq(x.f.mutations, mutations);
  cr_assert_eq(x.f.countRules("eth0"), 1);
}

Test(redirector, target_down) {
  Fixture x;

  x.f.setLinkUp("ifb0", false);

  cr_assert_throw(x.r.install(x.eth0, x.vt), RuleInstallationError);
  cr_assert_not(x.f.getCapturePoint("eth0").has_value());

  x.vt.up = false;
  cr_assert_throw(x.r.install(x.eth0, x.vt), RuleInstallationError);
}

Test(redirector, foreign_qdisc) {
  Fixture x;

  x.f.addForeignCapturePoint("eth0", "clsact");
  auto mutations = x.f.mutations;

  cr_assert_throw(x.r.install(x.eth0, x.vt),
                  CapturePointExistsWithConflictingConfigError);
  cr_assert_eq(x.f.mutations, mutations);

  cr_assert_not(x.r.remove(x.eth0));
  cr_assert_eq(x.f.mutations, mutations);
  cr_assert_str_eq(x.f.getCapturePoint("eth0")->kind.c_str(), "clsact");
}

Test(redirector, foreign_rule) {
  Fixture x;

  kernel::RuleId other{1, (kernel::tc::U32_DEFAULT_HTID << 20) | 0x1};
  x.f.addForeignRule("eth0", other);
  auto mutations = x.f.mutations;

  cr_assert_throw(x.r.install(x.eth0, x.vt),
                  CapturePointExistsWithConflictingConfigError);
  cr_assert_eq(x.f.mutations, mutations);
  cr_assert(x.r.inspect(x.eth0, x.vt) == RedirectionStatus::CONFLICT);

  // Teardown must not remove the capture point with the foreign rule
  cr_assert_not(x.r.remove(x.eth0));
  cr_assert_eq(x.f.countRules("eth0"), 1);
  cr_assert(x.f.getCapturePoint("eth0").has_value());
}

Test(redirector, capture_point_without_rule) {
  Fixture x;

  x.f.addCapturePoint("eth0");
  auto mutations = x.f.mutations;

  cr_assert_throw(x.r.install(x.eth0, x.vt),
                  CapturePointExistsWithConflictingConfigError);
  cr_assert_eq(x.f.mutations, mutations);

  // An empty ingress qdisc is removed on teardown
  cr_assert(x.r.remove(x.eth0));
  cr_assert_not(x.f.getCapturePoint("eth0").has_value());

  cr_assert_no_throw(x.r.install(x.eth0, x.vt), std::exception);
}

Test(redirector, rollback) {
  Fixture x;

  x.f.failRules.insert("eth0");

  cr_assert_throw(x.r.install(x.eth0, x.vt), RuleInstallationError);

  // The capture point which has been created by install() is gone again
  cr_assert_not(x.f.getCapturePoint("eth0").has_value());
  cr_assert_eq(x.f.countRules("eth0"), 0);
}

Test(redirector, other_target) {
  Fixture x;

  x.r.install(x.eth0, x.vt);

  // Our rule, but pointing to another virtual target
  PhysicalInterface other{"eth0", "", 1};
  auto vt1 = x.p.ensure(other);

  cr_assert_throw(x.r.install(x.eth0, vt1), RuleInstallationError);
}

Test(redirector, missing_interface) {
  Fixture x;

  PhysicalInterface eth9{"eth9", "", 0};
  VirtualTarget vt{"ifb0", true, "eth9"};

  cr_assert_throw(x.r.install(eth9, vt), RuleInstallationError);
  cr_assert_not(x.r.remove(eth9));
}

Test(redirector, remove) {
  Fixture x;

  x.r.install(x.eth0, x.vt);

  cr_assert(x.r.remove(x.eth0));
  cr_assert_not(x.f.getCapturePoint("eth0").has_value());
  cr_assert(x.r.inspect(x.eth0, x.vt) == RedirectionStatus::ABSENT);

  // Already absent
  auto mutations = x.f.mutations;
  cr_assert_not(x.r.remove(x.eth0));
  cr_assert_eq(x.f.mutations, mutations);
}
