/* Unit tests for the virtual target provisioner.
 *
 * SPDX-FileCopyrightText: 2024 The wanem-router Authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <criterion/criterion.h>

#include <wanem/provisioner.hpp>
#include <wanem/router/exceptions.hpp>

#include "fake_facility.hpp"

using namespace wanem;
using namespace wanem::router;
using namespace wanem::test;

// cppcheck-suppress unknownMacro
TestSuite(provisioner, .description = "Virtual target provisioner");

Test(provisioner, create) {
  FakeFacility f;
  f.addDevice("eth0");

  VirtualTargetProvisioner p(f);
  PhysicalInterface pi{"eth0", "", 0};

  auto vt = p.ensure(pi);

  cr_assert_str_eq(vt.name.c_str(), "ifb0");
  cr_assert_str_eq(vt.owner.c_str(), "eth0");
  cr_assert(vt.up);

  auto link = f.getLink("ifb0");
  cr_assert(link.has_value());
  cr_assert_str_eq(link->kind.c_str(), "ifb");
  cr_assert(link->up);
}

Test(provisioner, idempotent) {
  FakeFacility f;
  VirtualTargetProvisioner p(f);
  PhysicalInterface pi{"eth1", "", 1};

  p.ensure(pi);

  auto mutations = f.mutations;

  auto vt = p.ensure(pi);

  cr_assert_str_eq(vt.name.c_str(), "ifb1");
  cr_assert_eq(f.mutations, mutations);
}

Test(provisioner, bring_up) {
  FakeFacility f;
  VirtualTargetProvisioner p(f);
  PhysicalInterface pi{"eth0", "", 0};

  f.addLink("ifb0", "ifb");
  auto mutations = f.mutations;

  auto vt = p.ensure(pi);

  cr_assert(vt.up);
  cr_assert(f.getLink("ifb0")->up);
  cr_assert_eq(f.mutations, mutations + 1);
}

Test(provisioner, prefix) {
  FakeFacility f;
  VirtualTargetProvisioner p(f, "shp");
  PhysicalInterface pi{"eth0", "", 3};

  cr_assert_str_eq(p.getName(pi).c_str(), "shp3");

  cr_assert_throw(p.setPrefix(""), ConfigError);
  cr_assert_throw(p.setPrefix("averyverylongname"), ConfigError);
  cr_assert_str_eq(p.getPrefix().c_str(), "shp");
}

Test(provisioner, failure) {
  FakeFacility f;
  VirtualTargetProvisioner p(f);
  PhysicalInterface pi{"eth1", "", 1};

  f.failLinks.insert("ifb1");

  cr_assert_throw(p.ensure(pi), VirtualTargetCreationError);
  cr_assert_not(f.hasLink("ifb1"));
}

Test(provisioner, foreign_link) {
  FakeFacility f;
  VirtualTargetProvisioner p(f);
  PhysicalInterface pi{"eth0", "", 0};

  // A physical device which happens to have the name of the virtual target
  f.addDevice("ifb0");
  auto mutations = f.mutations;

  cr_assert_throw(p.ensure(pi), VirtualTargetCreationError);
  cr_assert_not(p.remove(pi));

  cr_assert(f.hasLink("ifb0"));
  cr_assert_eq(f.mutations, mutations);
}

Test(provisioner, remove) {
  FakeFacility f;
  VirtualTargetProvisioner p(f);
  PhysicalInterface pi{"eth0", "", 0};

  p.ensure(pi);

  cr_assert(p.remove(pi));
  cr_assert_not(f.hasLink("ifb0"));

  // Already absent
  cr_assert_not(p.remove(pi));
}

Test(provisioner, inspect) {
  FakeFacility f;
  VirtualTargetProvisioner p(f);
  PhysicalInterface pi{"eth0", "", 0};

  cr_assert_not(p.inspect(pi).has_value());

  f.addLink("ifb0", "ifb");

  auto vt = p.inspect(pi);
  cr_assert(vt.has_value());
  cr_assert_not(vt->up);
}

Test(provisioner, registered_interface) {
  FakeFacility f;
  InterfaceRegistry reg;
  VirtualTargetProvisioner p(f);

  // An IFB device which is managed as a physical interface itself
  f.addDevice("eth0");
  f.addLink("ifb1", "ifb");
  f.setLinkUp("ifb1", true);

  reg.add("ifb1");
  auto pi = reg.add("eth0");

  p.setRegistry(&reg);
  auto mutations = f.mutations;

  cr_assert_str_eq(p.getName(pi).c_str(), "ifb1");
  cr_assert_throw(p.ensure(pi), VirtualTargetCreationError);
  cr_assert_not(p.inspect(pi).has_value());
  cr_assert_not(p.remove(pi));

  cr_assert(f.hasLink("ifb1"));
  cr_assert_eq(f.mutations, mutations);
}
