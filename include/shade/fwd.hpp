#ifndef SHADE_FWD_HPP
#define SHADE_FWD_HPP

#include "shade/settings.hpp"

SHADE_IF_DEBUG() // silence unused warning for settings.hpp

namespace shade {

/// @brief The default underlying type for scoped enumerations.
using Default_Underlying = unsigned char;

#define SHADE_ENUM_STRING_CASE(...)                                                                \
    case __VA_ARGS__: return #__VA_ARGS__

#define SHADE_ENUM_STRING_CASE8(...)                                                               \
    case __VA_ARGS__: return u8## #__VA_ARGS__

struct Analysis;
struct Binding_Shadow_Tracker;
struct Call_Info;
struct Collecting_Logger;
struct Diagnostic;
struct Element_Highlight;
struct Error_Tag;
struct Highlight;
struct Highlight_Options;
enum struct Highlight_Modifier : Default_Underlying;
enum struct Highlight_Tag : Default_Underlying;
struct Highlighted_Range;
struct HTML_Writer;
struct Ignorant_Logger;
enum struct IO_Error_Code : Default_Underlying;
enum struct Item_Kind : Default_Underlying;
struct Line_Col;
struct Line_Index;
struct Logger;
struct Macro_Context;
struct Parse_Instruction;
enum struct Parse_Instruction_Type : Default_Underlying;
struct Quote_Offsets;
template <typename, typename>
struct Result;
struct Semantics;
enum struct Severity : Default_Underlying;
struct Source_Semantics;
struct Success_Tag;
enum struct Syntax_Kind : unsigned short;
struct Syntax_Element;
struct Syntax_Tree;
struct Text_Range;
struct Token;

} // namespace shade

#endif
