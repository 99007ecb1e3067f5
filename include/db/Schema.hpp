#pragma once

namespace stratus::db {

// Idempotent CREATE TABLE / CREATE INDEX for every table the daemon uses.
void initTables();

}
