#include <cassert>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <set>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/links/download_link_issuer.hpp"
#include "internal/util/errors.hpp"

namespace {

using fleet::db::model::LinkVisibility;
using fleet::links::DownloadLinkIssuer;

constexpr uint64_t kHour = 60ULL * 60 * 1000;

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

DownloadLinkIssuer MakeIssuer() {
  return DownloadLinkIssuer(std::make_shared<fleet::db::memory::MemoryRepository>());
}

void TestIssueAndResolve() {
  auto issuer = MakeIssuer();
  auto link   = issuer.Issue("alice", kHour, LinkVisibility::kPublic);

  assert(link.id != 0);
  assert(link.token.size() >= 43);
  assert(link.expires_at_ms == link.created_at_ms + kHour);

  auto resolved = issuer.Resolve(link.token, std::nullopt, link.created_at_ms + 1);
  assert(resolved.id == link.id);
  assert(DownloadLinkIssuer::IsActive(link, link.created_at_ms + kHour - 1));

  // expires strictly at created + ttl
  assert(!DownloadLinkIssuer::IsActive(link, link.created_at_ms + kHour));
  assert(Throws<fleet::util::NotFound>([&] { issuer.Resolve(link.token, std::nullopt, link.created_at_ms + kHour); }));
}

void TestTokensAreUnique() {
  auto                  issuer = MakeIssuer();
  std::set<std::string> tokens;
  for (int i = 0; i < 50; ++i) tokens.insert(issuer.Issue("alice", std::nullopt, LinkVisibility::kPublic).token);
  assert(tokens.size() == 50);
}

void TestZeroTtlIsInactiveImmediately() {
  auto issuer = MakeIssuer();
  auto link   = issuer.Issue("alice", uint64_t{0}, LinkVisibility::kPublic);

  assert(link.expires_at_ms == link.created_at_ms);
  assert(!DownloadLinkIssuer::IsActive(link, link.created_at_ms));
  assert(Throws<fleet::util::NotFound>([&] { issuer.Resolve(link.token, std::nullopt, link.created_at_ms); }));
}

void TestNoTtlNeverExpires() {
  auto issuer = MakeIssuer();
  auto link   = issuer.Issue("alice", std::nullopt, LinkVisibility::kPublic);

  assert(!link.expires_at_ms.has_value());
  assert(DownloadLinkIssuer::IsActive(link, link.created_at_ms + 3650 * 24 * kHour));
}

void TestRevocationIsPermanent() {
  auto issuer = MakeIssuer();
  auto link   = issuer.Issue("alice", std::nullopt, LinkVisibility::kPublic);

  auto revoked = issuer.Revoke(link.id);
  assert(revoked.revoked_at_ms != 0);
  assert(!DownloadLinkIssuer::IsActive(revoked, revoked.revoked_at_ms));
  assert(Throws<fleet::util::NotFound>([&] { issuer.Resolve(link.token, std::string("alice"), link.created_at_ms); }));

  assert(Throws<fleet::util::TerminalStateViolation>([&] { issuer.Revoke(link.id); }));
  assert(issuer.Get(link.id).revoked_at_ms == revoked.revoked_at_ms);
  assert(Throws<fleet::util::NotFound>([&] { issuer.Revoke(4242); }));
}

void TestRestrictedLinksRequireAPrincipal() {
  auto issuer = MakeIssuer();
  auto link   = issuer.Issue("alice", std::nullopt, LinkVisibility::kRestricted);

  assert(DownloadLinkIssuer::RequireLogin(link));
  assert(Throws<fleet::util::AuthenticationFailure>([&] { issuer.Resolve(link.token, std::nullopt, link.created_at_ms); }));
  assert(Throws<fleet::util::AuthenticationFailure>(
      [&] { issuer.Resolve(link.token, std::string(), link.created_at_ms); }));
  assert(issuer.Resolve(link.token, std::string("bob"), link.created_at_ms).id == link.id);
}

void TestInvalidInputs() {
  auto issuer = MakeIssuer();
  assert(Throws<fleet::util::InvalidArgument>([&] { issuer.Issue("", std::nullopt, LinkVisibility::kPublic); }));
  assert(Throws<fleet::util::InvalidArgument>([&] { issuer.Resolve("", std::nullopt, 1); }));
  assert(Throws<fleet::util::NotFound>([&] { issuer.Resolve("no-such-token", std::nullopt, 1); }));

  // an expiry past the 64-bit range must not wrap into the past
  const auto max = std::numeric_limits<uint64_t>::max();
  assert(Throws<fleet::util::InvalidArgument>([&] { issuer.Issue("alice", max, LinkVisibility::kPublic); }));
  assert(Throws<fleet::util::InvalidArgument>([&] { issuer.Issue("alice", max - 1000, LinkVisibility::kPublic); }));
}

} // namespace

int main() {
  TestIssueAndResolve();
  TestTokensAreUnique();
  TestZeroTtlIsInactiveImmediately();
  TestNoTtlNeverExpires();
  TestRevocationIsPermanent();
  TestRestrictedLinksRequireAPrincipal();
  TestInvalidInputs();

  std::cout << "fleet_unit_download_link: pass\n";
  return 0;
}
