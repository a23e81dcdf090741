#include <gtest/gtest.h>
#include <vellum/audit/audit_store.hpp>
#include <vellum/chain/canonical_encoder.hpp>
#include <vellum/chain/hash_chainer.hpp>
#include <vellum/common/error.hpp>
#include <vellum/testing/audit_fixture.hpp>

#include <string>
#include <string_view>

namespace {

vellum::schema::audit_entry_t make_draft(vellum::audit::audit_store& store,
                                         const std::string_view tenant,
                                         const std::string_view description) {
  auto entry = vellum::schema::audit_entry_t{};
  entry.tenant_id = std::string{tenant};
  entry.event_type = vellum::schema::event_type_t::created;
  entry.actor_id = "u1";
  entry.timestamp = vellum::testing::kFixedNow;
  entry.description = std::string{description};
  auto last = store.last_for_tenant(tenant);
  entry.previous_hash =
      last ? last->content_hash : vellum::chain::hash_chainer::genesis_hash();
  entry.content_hash = vellum::chain::hash_chainer::compute(
      vellum::chain::make_chain_fields(entry));
  return entry;
}

}  // namespace

TEST(audit_store, ids_increase_across_tenants) {
  auto fixture = vellum::testing::audit_fixture{"vellum_store_ids"};
  auto& store = fixture.store();

  auto a1 = store.append(make_draft(store, "A", "first"));
  auto b1 = store.append(make_draft(store, "B", "first"));
  auto a2 = store.append(make_draft(store, "A", "second"));

  EXPECT_EQ(a1.id, 1u);
  EXPECT_EQ(b1.id, 2u);
  EXPECT_EQ(a2.id, 3u);
  EXPECT_EQ(a2.previous_hash, a1.content_hash);
  EXPECT_EQ(b1.previous_hash, vellum::chain::hash_chainer::genesis_hash());
}

TEST(audit_store, append_rejects_a_stale_previous_hash) {
  auto fixture = vellum::testing::audit_fixture{"vellum_store_conflict"};
  auto& store = fixture.store();

  auto stale = make_draft(store, "A", "first");
  store.append(stale);
  EXPECT_THROW(store.append(stale), vellum::common::conflict_error);
  EXPECT_EQ(store.list_for_tenant("A").size(), 1u);
}

TEST(audit_store, append_rejects_an_empty_tenant) {
  auto fixture = vellum::testing::audit_fixture{"vellum_store_tenant"};
  auto entry = make_draft(fixture.store(), "A", "first");
  entry.tenant_id.clear();
  EXPECT_THROW(fixture.store().append(entry),
               vellum::common::validation_error);
}

TEST(audit_store, tenants_are_isolated) {
  auto fixture = vellum::testing::audit_fixture{"vellum_store_isolation"};
  auto& store = fixture.store();

  store.append(make_draft(store, "A", "a1"));
  store.append(make_draft(store, "B", "b1"));
  store.append(make_draft(store, "A", "a2"));

  auto a = store.list_for_tenant("A");
  ASSERT_EQ(a.size(), 2u);
  EXPECT_EQ(a[0].description, "a1");
  EXPECT_EQ(a[1].description, "a2");

  auto b = store.list_for_tenant("B");
  ASSERT_EQ(b.size(), 1u);
  EXPECT_EQ(b[0].tenant_id, "B");

  EXPECT_TRUE(store.list_for_tenant("C").empty());
  EXPECT_FALSE(store.last_for_tenant("C").has_value());
  EXPECT_EQ(store.last_for_tenant("A")->description, "a2");
  EXPECT_EQ(store.list_tenants(), (std::vector<std::string>{"A", "B"}));
}

TEST(audit_store, get_looks_up_by_id) {
  auto fixture = vellum::testing::audit_fixture{"vellum_store_get"};
  auto& store = fixture.store();

  auto appended = store.append(make_draft(store, "A", "first"));
  auto loaded = store.get(appended.id);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(*loaded, appended);
  EXPECT_FALSE(store.get(appended.id + 1).has_value());
}

TEST(audit_store, apply_transition_touches_lifecycle_fields_only) {
  auto fixture = vellum::testing::audit_fixture{"vellum_store_transition"};
  auto& store = fixture.store();

  auto appended = store.append(make_draft(store, "A", "first"));
  auto changed = store.apply_transition(
      appended.id, [](const vellum::schema::audit_entry_t&) {
        return vellum::audit::lifecycle_change{
            .state = vellum::schema::lifecycle_state_t::validated,
            .assign_reference = true};
      });

  EXPECT_EQ(changed.lifecycle_state,
            vellum::schema::lifecycle_state_t::validated);
  EXPECT_EQ(changed.sequence_reference, "CREATED-000001");
  EXPECT_EQ(changed.content_hash, appended.content_hash);
  EXPECT_EQ(*store.get(appended.id), changed);

  EXPECT_THROW(store.apply_transition(
                   99,
                   [](const vellum::schema::audit_entry_t&) {
                     return vellum::audit::lifecycle_change{};
                   }),
               vellum::common::not_found_error);
}

TEST(audit_store, references_count_per_tenant) {
  auto fixture = vellum::testing::audit_fixture{"vellum_store_sequence"};
  auto& store = fixture.store();
  auto validate = [&store](const vellum::schema::entry_id_t id) {
    return store
        .apply_transition(id,
                          [](const vellum::schema::audit_entry_t&) {
                            return vellum::audit::lifecycle_change{
                                .state = vellum::schema::lifecycle_state_t::
                                    validated,
                                .assign_reference = true};
                          })
        .sequence_reference;
  };

  auto a1 = store.append(make_draft(store, "A", "a1"));
  auto a2 = store.append(make_draft(store, "A", "a2"));
  auto b1 = store.append(make_draft(store, "B", "b1"));

  EXPECT_EQ(validate(a1.id), "CREATED-000001");
  EXPECT_EQ(validate(b1.id), "CREATED-000001");
  EXPECT_EQ(validate(a2.id), "CREATED-000002");
  // An entry keeps the reference it already has.
  EXPECT_EQ(validate(a1.id), "CREATED-000001");
}
