/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TEXT_TEMPLATE_HPP
#define TEXT_TEMPLATE_HPP

#include <map>
#include <string>

namespace Realmforge {

using TemplateValues = std::map<std::string, std::string>;

/**
 * @brief Substitutes {name} placeholders from values
 *
 * Every occurrence of a known key is replaced. Placeholders still left
 * afterwards (non-empty text between braces) are removed, so a description
 * never shows raw template syntax.
 *
 * fillTemplate("A {quality} {material} blade {unknown}",
 *              {{"quality","fine"},{"material","iron"}})
 *   -> "A fine iron blade "
 */
std::string fillTemplate(const std::string &text, const TemplateValues &values);

// Uppercases the first character (ASCII)
std::string capitalize(const std::string &text);

// ASCII lowercase copy
std::string toLower(const std::string &text);

} // namespace Realmforge

#endif // TEXT_TEMPLATE_HPP
