#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/auth/key_registry.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using fleet::auth::KeyHasher;
using fleet::auth::KeyRegistry;

std::shared_ptr<KeyRegistry> MakeRegistry() {
  // low iteration count keeps the suite fast; the format is unchanged
  return std::make_shared<KeyRegistry>(std::make_shared<fleet::db::memory::MemoryRepository>(), KeyHasher(1000));
}

void TestGeneratedKeyVerifies() {
  auto registry = MakeRegistry();
  auto issued   = registry->Generate("edge-01", "rack 4", "ops");

  assert(issued.plain_key.rfind("fleet_" + issued.credential.prefix + "_", 0) == 0);
  assert(issued.credential.key_hash.find(issued.plain_key) == std::string::npos);

  auto verified = registry->Verify(issued.plain_key);
  assert(verified.has_value());
  assert(verified->id == issued.credential.id);
  assert(verified->default_principal == "ops");
  assert(registry->Get(issued.credential.id).last_used_at_ms != 0);
}

void TestMalformedAndWrongKeysFail() {
  auto registry = MakeRegistry();
  auto issued   = registry->Generate("edge-02", "", "");

  assert(!registry->Verify("").has_value());
  assert(!registry->Verify("not-a-key").has_value());
  assert(!registry->Verify("fleet__secret").has_value());
  assert(!registry->Verify("other_" + issued.credential.prefix + "_x").has_value());

  // right prefix, wrong secret
  assert(!registry->Verify("fleet_" + issued.credential.prefix + "_wrongsecret").has_value());
  // unknown prefix
  assert(!registry->Verify("fleet_000000000000_whatever").has_value());
}

void TestRevokedKeyFailsForever() {
  auto registry = MakeRegistry();
  auto issued   = registry->Generate("edge-03", "", "");

  auto revoked = registry->Revoke(issued.credential.id);
  assert(revoked.revoked_at_ms != 0);

  for (int i = 0; i < 3; ++i) {
    assert(!registry->Verify(issued.plain_key).has_value());
  }

  bool threw = false;
  try {
    registry->Authenticate(issued.plain_key);
  } catch (const fleet::util::AuthenticationFailure&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    registry->Revoke(issued.credential.id);
  } catch (const fleet::util::TerminalStateViolation&) {
    threw = true;
  }
  assert(threw && "second revoke must be rejected");
}

void TestRotateReplacesSecret() {
  auto registry = MakeRegistry();
  auto original = registry->Generate("edge-04", "", "");
  registry->Revoke(original.credential.id);

  auto rotated = registry->Rotate(original.credential.id);
  assert(rotated.credential.id == original.credential.id);
  assert(rotated.plain_key != original.plain_key);
  assert(rotated.credential.revoked_at_ms == 0);

  assert(!registry->Verify(original.plain_key).has_value());
  assert(registry->Verify(rotated.plain_key).has_value());
}

void TestNameIsRequiredAndListing() {
  auto registry = MakeRegistry();

  bool threw = false;
  try {
    registry->Generate("", "", "");
  } catch (const fleet::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  registry->Generate("a", "", "");
  registry->Generate("b", "", "");
  const auto all = registry->List();
  assert(all.size() == 2);
  assert(all[0].name == "a");

  threw = false;
  try {
    registry->Get(999);
  } catch (const fleet::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestHasherFormat() {
  KeyHasher  hasher(1000);
  const auto encoded = hasher.Hash("fleet_abc_def");
  assert(encoded.rfind("pbkdf2_sha256$1000$", 0) == 0);
  assert(hasher.Verify("fleet_abc_def", encoded));
  assert(!hasher.Verify("fleet_abc_deg", encoded));
  assert(!hasher.Verify("fleet_abc_def", "pbkdf2_sha256$x$zz$zz"));
  // salted: same input hashes differently
  assert(hasher.Hash("fleet_abc_def") != encoded);
  // iteration count travels with the hash
  assert(KeyHasher(2000).Verify("fleet_abc_def", encoded));
}

} // namespace

int main() {
  TestGeneratedKeyVerifies();
  TestMalformedAndWrongKeysFail();
  TestRevokedKeyFailsForever();
  TestRotateReplacesSecret();
  TestNameIsRequiredAndListing();
  TestHasherFormat();

  std::cout << "fleet_unit_key_registry: pass\n";
  return 0;
}
