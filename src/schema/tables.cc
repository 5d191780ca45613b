// Copyright 2026 The didpoop Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

// =====================================================================
// c++ std
// =====================================================================

#include <string>
#include <vector>

// =====================================================================
// local libraries
// =====================================================================

#include "src/schema/schema.h"

// =====================================================================
// self header
// =====================================================================

#include "src/schema/tables.h"

namespace didpoop::schema {

namespace {

Column* add_column(Table* table, const std::string& name,
                   const std::string& type) {
    auto column = table->add_columns();
    column->set_name(name);
    column->set_type(type);
    column->set_not_null(true);
    return column;
}

// id bigint primary key default id_gen()
void add_id(Table* table) {
    auto column = add_column(table, "id", "bigint");
    column->set_is_primary_key(true);
    column->set_default_kind(DEFAULT_ID_GEN);
}

// bigint not null references <target>(<column>)
void add_reference(Table* table, const std::string& name,
                   const std::string& target, const std::string& target_column,
                   bool cascade = false) {
    auto column = add_column(table, name, "bigint");
    auto fk = column->mutable_references();
    fk->set_table(target);
    fk->set_column(target_column);
    fk->set_on_delete_cascade(cascade);
}

// deleted, created, modified
void add_bookkeeping(Table* table) {
    add_column(table, kDeletedColumn, "boolean")
        ->set_default_kind(DEFAULT_FALSE);
    add_column(table, "created", "timestamptz")->set_default_kind(DEFAULT_NOW);
    add_column(table, kModifiedColumn, "timestamptz")
        ->set_default_kind(DEFAULT_NOW);
}

// create index <name> on <table>(<column>) where deleted is false
void add_index(Table* table, const std::string& name,
               const std::string& column) {
    auto index = table->add_indexes();
    index->set_name(name);
    index->set_column(column);
    index->set_only_undeleted(true);
}

Table users() {
    Table table;
    table.set_name(kUsers);
    add_id(&table);
    add_column(&table, "email", "text")->set_unique(true);
    add_column(&table, "name", "text");
    add_column(&table, "pw_salt", "text");
    add_column(&table, "pw_hash", "text");
    add_bookkeeping(&table);
    add_index(&table, "users_email", "email");
    return table;
}

Table auth_tokens() {
    Table table;
    table.set_name(kAuthTokens);
    add_id(&table);
    add_reference(&table, "user_id", kUsers, "id", /*cascade=*/true);
    add_column(&table, "hash", "text")->set_unique(true);
    add_column(&table, "expires", "timestamptz");
    add_bookkeeping(&table);
    add_index(&table, "auth_tokens_user_id", "user_id");
    add_index(&table, "auth_tokens_hash", "hash");
    add_index(&table, "auth_tokens_expires", "expires");
    return table;
}

Table creatures() {
    Table table;
    table.set_name(kCreatures);
    add_id(&table);
    add_reference(&table, "creator_id", kUsers, "id");
    add_column(&table, "name", "text");
    add_bookkeeping(&table);
    add_index(&table, "idx_creatures_creator", "creator_id");
    return table;
}

Table creature_access_kind() {
    Table table;
    table.set_name(kCreatureAccessKind);
    add_column(&table, "kind", "text")->set_is_primary_key(true);
    return table;
}

Table creature_access() {
    Table table;
    table.set_name(kCreatureAccess);
    add_id(&table);
    add_reference(&table, "creature_id", kCreatures, "id");
    add_reference(&table, "user_id", kUsers, "id");
    add_reference(&table, "creator_id", kUsers, "id");
    auto kind = add_column(&table, "kind", "text");
    kind->mutable_references()->set_table(kCreatureAccessKind);
    kind->mutable_references()->set_column("kind");
    add_bookkeeping(&table);
    add_index(&table, "idx_creature_access_creature", "creature_id");
    add_index(&table, "idx_creature_access_user", "user_id");
    add_index(&table, "idx_creature_access_creator", "creator_id");
    add_index(&table, "idx_creature_access_kind", "kind");
    return table;
}

Table poops() {
    Table table;
    table.set_name(kPoops);
    add_id(&table);
    add_reference(&table, "creator_id", kUsers, "id");
    add_reference(&table, "creature_id", kCreatures, "id");
    add_bookkeeping(&table);
    add_index(&table, "idx_poop_creator", "creator_id");
    add_index(&table, "idx_poop_creature", "creature_id");
    return table;
}

}  // namespace

std::vector<Table> builtin_tables() {
    return {
        users(),
        auth_tokens(),
        creatures(),
        creature_access_kind(),
        creature_access(),
        poops(),
    };
}

}  // namespace didpoop::schema
