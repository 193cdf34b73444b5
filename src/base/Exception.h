///////////////////////////////////////////////////////////////////////////////
///
///	\file    Exception.h
///	\version October 19, 2026
///
///	<summary>
///		This file provides functionality for formatted Exceptions.
///	</summary>
///	<remarks>
///		Copyright 2000-2026 Paul Ullrich
///
///		This file is distributed as part of the GridRegimes source code package.
///		Permission is granted to use, copy, modify and distribute this
///		source code and its documentation under the terms of the GNU General
///		Public License.  This software is provided "as is" without express
///		or implied warranty.
///	</remarks>

#ifndef _EXCEPTION_H_
#define _EXCEPTION_H_

///////////////////////////////////////////////////////////////////////////////

#include <string>
#include <cstdio>
#include <cstdarg>

///////////////////////////////////////////////////////////////////////////////

#define _EXCEPTION() \
throw Exception(__FILE__, __LINE__)

#define _EXCEPTIONT(text) \
throw Exception(__FILE__, __LINE__, text)

#define _EXCEPTION1(text, var1) \
throw Exception(__FILE__, __LINE__, text, var1)

#define _EXCEPTION2(text, var1, var2) \
throw Exception(__FILE__, __LINE__, text, var1, var2)

#define _EXCEPTION3(text, var1, var2, var3) \
throw Exception(__FILE__, __LINE__, text, var1, var2, var3)

#define _EXCEPTION4(text, var1, var2, var3, var4) \
throw Exception(__FILE__, __LINE__, text, var1, var2, var3, var4)

#define _EXCEPTION5(text, var1, var2, var3, var4, var5) \
throw Exception(__FILE__, __LINE__, text, var1, var2, var3, var4, var5)

///////////////////////////////////////////////////////////////////////////////

#define _SOURCEERRORT(text) \
throw SourceError(__FILE__, __LINE__, text)

#define _SOURCEERROR1(text, var1) \
throw SourceError(__FILE__, __LINE__, text, var1)

#define _SOURCEERROR2(text, var1, var2) \
throw SourceError(__FILE__, __LINE__, text, var1, var2)

#define _SOURCEERROR3(text, var1, var2, var3) \
throw SourceError(__FILE__, __LINE__, text, var1, var2, var3)

#define _SOURCEERROR4(text, var1, var2, var3, var4) \
throw SourceError(__FILE__, __LINE__, text, var1, var2, var3, var4)

///////////////////////////////////////////////////////////////////////////////

#define _INSUFFICIENTDATAT(text) \
throw InsufficientDataError(__FILE__, __LINE__, text)

#define _INSUFFICIENTDATA1(text, var1) \
throw InsufficientDataError(__FILE__, __LINE__, text, var1)

#define _INSUFFICIENTDATA2(text, var1, var2) \
throw InsufficientDataError(__FILE__, __LINE__, text, var1, var2)

#define _INSUFFICIENTDATA3(text, var1, var2, var3) \
throw InsufficientDataError(__FILE__, __LINE__, text, var1, var2, var3)

#define _INSUFFICIENTDATA5(text, var1, var2, var3, var4, var5) \
throw InsufficientDataError(__FILE__, __LINE__, text, var1, var2, var3, var4, var5)

///////////////////////////////////////////////////////////////////////////////

#if defined(REGIMES_DEBUG)
#define _ASSERT(x) \
if (!(x)) { throw Exception(__FILE__, __LINE__, "Assertion failure: %s", #x); }
#else
#define _ASSERT(x)
#endif

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		An Exception is a formatted error message that is generated from a
///		throw directive.  This class is automatically generated when using
///		the _EXCEPTION macros.
///	</summary>
class Exception {

	public:
		///	<summary>
		///		Maximum buffer size for exception strings.
		///	</summary>
		static const int ExceptionBufferSize = 1024;

	public:
		///	<summary>
		///		Generic constructor.
		///	</summary>
		Exception(
			const char * szFile,
			unsigned int uiLine
		) :
			m_strText("General exception"),
			m_strFile(szFile),
			m_uiLine(uiLine)
		{ }

		///	<summary>
		///		Constructor with text and variables.
		///	</summary>
		Exception(
			const char * szFile,
			unsigned int uiLine,
			const char * szText,
			...
		) :
			m_strFile(szFile),
			m_uiLine(uiLine)
		{
			char szBuffer[ExceptionBufferSize];

			va_list arguments;

			// Initialize the argument list
			va_start(arguments, szText);

			// Write to string
			vsnprintf(szBuffer, ExceptionBufferSize, szText, arguments);

			m_strText = szBuffer;

			// Cleans up the argument list
			va_end(arguments);
		}

		///	<summary>
		///		Virtual destructor.
		///	</summary>
		virtual ~Exception() { }

	public:
		///	<summary>
		///		Get a string representation of this exception.
		///	</summary>
		std::string ToString() const {
			std::string strReturn;

			char szBuffer[128];

			// Preamble
			snprintf(szBuffer, 128, "%s (", GetPreamble());
			strReturn.append(szBuffer);

			// File name
			strReturn.append(m_strFile);

			// Line number
			snprintf(szBuffer, 128, ", Line %u) ", m_uiLine);
			strReturn.append(szBuffer);

			// Text
			strReturn.append(m_strText);

			return strReturn;
		}

		///	<summary>
		///		Get the text of this exception without location.
		///	</summary>
		const std::string & GetText() const {
			return m_strText;
		}

	protected:
		///	<summary>
		///		Label printed ahead of the location in ToString().
		///	</summary>
		virtual const char * GetPreamble() const {
			return "EXCEPTION";
		}

	private:
		///	<summary>
		///		A string denoting the error in question.
		///	</summary>
		std::string m_strText;

		///	<summary>
		///		A string containing the filename where the exception occurred.
		///	</summary>
		std::string m_strFile;

		///	<summary>
		///		A constant containing the line number where the exception
		///		occurred.
		///	</summary>
		unsigned int m_uiLine;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Unreadable or malformed input, unknown variable or out-of-range
///		unit index.
///	</summary>
class SourceError : public Exception {

	public:
		template <typename... Args>
		SourceError(
			const char * szFile,
			unsigned int uiLine,
			const char * szText,
			Args... args
		) :
			Exception(szFile, uiLine, szText, args...)
		{ }

	protected:
		virtual const char * GetPreamble() const {
			return "SOURCE ERROR";
		}
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Too few valid feature vectors to produce a cluster model.
///	</summary>
class InsufficientDataError : public Exception {

	public:
		template <typename... Args>
		InsufficientDataError(
			const char * szFile,
			unsigned int uiLine,
			const char * szText,
			Args... args
		) :
			Exception(szFile, uiLine, szText, args...)
		{ }

	protected:
		virtual const char * GetPreamble() const {
			return "INSUFFICIENT DATA";
		}
};

///////////////////////////////////////////////////////////////////////////////

#endif

