#pragma once
#include <cstdint>
#include <cstddef>

/** \file dwell/types.hpp basic types
 *
 * This header includes the basic typedefs shared by every dwell component.
 */

namespace dwell {
/** Integer type that stores the identifier of a Property or an Agent.
 *
 * Property ids come from the external market rows and are unique within an Inventory.  Agent ids
 * are assigned sequentially, starting at 1, when a population is generated.  The two id spaces
 * are independent: a property and an agent may share the same numeric id.
 *
 * Note that attempting to use this name via `using namespace dwell;` can result in ambiguous use
 * (conflicting with the `id_t` C typedef from system headers); you can avoid the ambiguity by
 * either importing it explicitly (`using dwell::id_t;`) or by always qualifying it.
 */
using id_t = std::uint64_t;

/** Signed integer type holding a calendar year.  Signed so that year differences (property ages)
 * can be computed directly.
 */
using year_t = std::int32_t;

/** std::size_t alias primarily for internal dwell use. */
using size_t = std::size_t;

/** The calendar year used by default for new-construction and quality-score calculations. */
constexpr year_t default_reference_year = 2024;

}
