#include "schema_inspector.hpp"

#include <algorithm>
#include <sstream>

#include "sqlite_statement.hpp"

namespace canary::db::sqlite {

std::string QuoteIdentifier(std::string_view identifier) {
  std::string out;
  out.reserve(identifier.size() + 2);
  out.push_back('"');
  for (char c : identifier) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

bool TableExists(SqliteDB& db, const std::string& table) {
  Statement st(db.Handle(), "SELECT 1 FROM sqlite_master WHERE type='table' AND name=?;");
  st.BindText(1, table);
  return st.Step();
}

std::vector<ColumnInfo> TableColumns(SqliteDB& db, const std::string& table) {
  // PRAGMA table_info: cid, name, type, notnull, dflt_value, pk
  Statement st(db.Handle(), "PRAGMA table_info(" + QuoteIdentifier(table) + ");");

  std::vector<ColumnInfo> columns;
  while (st.Step()) {
    ColumnInfo c;
    c.name     = st.ColumnText(1);
    c.type     = st.ColumnText(2);
    c.not_null = st.ColumnInt64(3) != 0;
    c.pk       = static_cast<int>(st.ColumnInt64(5));
    columns.push_back(std::move(c));
  }
  return columns;
}

std::optional<std::string> PrimaryKeyColumn(SqliteDB& db, const std::string& table) {
  std::optional<std::string> pk;
  for (const auto& column : TableColumns(db, table)) {
    if (column.pk == 0) continue;
    if (pk) return std::nullopt;  // composite
    pk = column.name;
  }
  return pk;
}

SchemaFingerprint InspectSchema(SqliteDB& db) {
  std::vector<std::string> names;
  {
    Statement st(db.Handle(),
                 "SELECT name FROM sqlite_master WHERE type='table' AND name NOT LIKE 'sqlite\\_%' ESCAPE '\\' ORDER BY name;");
    while (st.Step()) {
      names.push_back(st.ColumnText(0));
    }
  }

  SchemaFingerprint schema;
  for (const auto& name : names) {
    TableInfo info;
    info.name    = name;
    info.columns = TableColumns(db, name);

    Statement count(db.Handle(), "SELECT COUNT(*) FROM " + QuoteIdentifier(name) + ";");
    if (count.Step()) {
      info.row_count = count.ColumnInt64(0);
    }
    schema.emplace(name, std::move(info));
  }
  return schema;
}

std::string DescribeColumnMismatch(const std::vector<ColumnInfo>& expected, const std::vector<ColumnInfo>& actual) {
  std::ostringstream out;
  bool first = true;
  auto note = [&](const std::string& text) {
    if (!first) out << "; ";
    first = false;
    out << text;
  };

  for (const auto& want : expected) {
    auto it = std::find_if(actual.begin(), actual.end(), [&](const ColumnInfo& c) { return c.name == want.name; });
    if (it == actual.end()) {
      note("missing column " + want.name);
    } else if (!(*it == want)) {
      note("column " + want.name + " differs (expected " + want.type + (want.not_null ? " NOT NULL" : "") +
           (want.pk ? " PK" : "") + ", found " + it->type + (it->not_null ? " NOT NULL" : "") + (it->pk ? " PK" : "") + ")");
    }
  }
  for (const auto& have : actual) {
    auto it = std::find_if(expected.begin(), expected.end(), [&](const ColumnInfo& c) { return c.name == have.name; });
    if (it == expected.end()) {
      note("unexpected column " + have.name);
    }
  }
  return out.str();
}

} // namespace canary::db::sqlite
