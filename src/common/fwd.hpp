#ifndef PARADOX_DATA_FWD_HPP
#define PARADOX_DATA_FWD_HPP

#include "common/config.hpp"

namespace paradox_data {

enum struct Code_Span_Type : Default_Underlying;
enum struct IO_Error_Code : Default_Underlying;
enum struct Text_Encoding : Default_Underlying;

struct Local_Source_Position;
struct Local_Source_Span;
struct Source_Position;
struct Code_String;
struct IO_Error;

} // namespace paradox_data

#endif
