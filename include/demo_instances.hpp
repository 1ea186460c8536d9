#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "catalog.hpp"
#include <string>


///////////////////////////
///     DEMO CATALOGS   ///
///////////////////////////
/**
 * @brief Size of the synthetic catalogs used by the demo drivers.
 *
 * S and M are small hand-written semesters; L and XL are generated and
 * grow quickly enough that XL always hits any practical candidate cap.
 */
enum class DemoSize { S, M, L, XL };

/**
 * @brief Build a synthetic catalog of the requested size.
 */
Catalog makeDemoCatalog(DemoSize size);

/**
 * @brief Parse "S", "M", "L" or "XL" (any case).
 *
 * @throws std::invalid_argument for anything else.
 */
DemoSize parseDemoSize(const std::string& text);

/// "S", "M", "L" or "XL".
std::string demoSizeName(DemoSize size);
