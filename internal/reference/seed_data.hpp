#pragma once

#include "internal/db/api/repository.hpp"

namespace ticketflow::reference {

/*
  Default reference rows for a fresh database: job, ticket types,
  materials (with manifest requirement), sources, destinations and
  vendors. Existing rows are left untouched.

  Returns the number of rows inserted.
*/
std::size_t SeedDefaults(db::Repository& repository);

} // namespace ticketflow::reference
