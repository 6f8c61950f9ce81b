#pragma once

// Everything a program needs to read, write and map configuration files.

#include <cf/convert.h>
#include <cf/directive.h>
#include <cf/error.h>
#include <cf/file_io.h>
#include <cf/lexer.h>
#include <cf/mapper.h>
#include <cf/naming.h>
#include <cf/options.h>
#include <cf/parse.h>
#include <cf/serialize.h>
