/*
	MIT License

	Copyright (c) 2024 Truong Hy

	Permission is hereby granted, free of charge, to any person obtaining a copy
	of this software and associated documentation files (the "Software"), to deal
	in the Software without restriction, including without limitation the rights
	to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
	copies of the Software, and to permit persons to whom the Software is
	furnished to do so, subject to the following conditions:

	The above copyright notice and this permission notice shall be included in all
	copies or substantial portions of the Software.

	THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
	IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
	FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
	AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
	LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
	OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
	SOFTWARE.

	Version: 20241019

	Preprocessor helpers for building an enum and a matching string table from
	a single X-macro list.
*/

#ifndef K1_MACRO_H
#define K1_MACRO_H

#define K1_ENUM_ITEM(id, str) id,
#define K1_STRING_ITEM(id, str) str,

// Creates an enum from a list
#define CREATE_ENUM(name, list) \
	typedef enum{ \
		list(K1_ENUM_ITEM) \
	}name;

// Creates an inline array of strings indexed by the enum of the same list
#define INIT_INLINE_CLASS_ARRAY_ENUM(type, name, list) \
	type name[] = { \
		list(K1_STRING_ITEM) \
	};

#define K1_UNUSED(x) (void)(x)

#endif
