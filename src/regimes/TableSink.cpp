///////////////////////////////////////////////////////////////////////////////
///
///	\file    TableSink.cpp
///	\version October 19, 2026
///
///	<remarks>
///		Copyright 2000-2026 Paul Ullrich
///
///		This file is distributed as part of the GridRegimes source code package.
///		Permission is granted to use, copy, modify and distribute this
///		source code and its documentation under the terms of the GNU General
///		Public License.  This software is provided "as is" without express
///		or implied warranty.
///	</remarks>

#include "TableSink.h"
#include "STLStringHelper.h"
#include "Exception.h"

#include <cstdio>

///////////////////////////////////////////////////////////////////////////////

void Table::AddRow(
	const std::vector<std::string> & vecRow
) {
	if (vecRow.size() != vecColumns.size()) {
		_EXCEPTION2("Row has %lu fields but the table has %lu columns",
			static_cast<unsigned long>(vecRow.size()),
			static_cast<unsigned long>(vecColumns.size()));
	}
	vecRows.push_back(vecRow);
}

///////////////////////////////////////////////////////////////////////////////

int Table::FindColumn(
	const std::string & strColumn
) const {
	for (size_t c = 0; c < vecColumns.size(); c++) {
		if (vecColumns[c] == strColumn) {
			return static_cast<int>(c);
		}
	}
	return (-1);
}

///////////////////////////////////////////////////////////////////////////////

std::string FormatTableReal(
	double dValue,
	const char * szFormat
) {
	char szBuffer[64];
	snprintf(szBuffer, sizeof(szBuffer), szFormat, dValue);
	return std::string(szBuffer);
}

///////////////////////////////////////////////////////////////////////////////

std::string FormatTableInteger(
	long lValue
) {
	char szBuffer[32];
	snprintf(szBuffer, sizeof(szBuffer), "%li", lValue);
	return std::string(szBuffer);
}

///////////////////////////////////////////////////////////////////////////////

char DelimitedTableSink::ParseDelimiter(
	const std::string & strDelimiter
) {
	std::string strLower = strDelimiter;
	STLStringHelper::ToLower(strLower);

	if ((strLower == "tab") || (strLower == "\\t") || (strLower == "\t")) {
		return '\t';
	}
	if (strLower == "comma") {
		return ',';
	}
	if (strLower == "semicolon") {
		return ';';
	}
	if (strDelimiter.length() == 1) {
		if ((strDelimiter[0] == '"') || (strDelimiter[0] == '\n')) {
			_EXCEPTION1("Invalid delimiter \"%s\"", strDelimiter.c_str());
		}
		return strDelimiter[0];
	}
	_EXCEPTION1("Invalid delimiter \"%s\" (expected \",\" or \"tab\")",
		strDelimiter.c_str());
}

///////////////////////////////////////////////////////////////////////////////

std::string DelimitedTableSink::QuoteField(
	const std::string & strField
) const {
	bool fQuote = false;
	for (size_t i = 0; i < strField.length(); i++) {
		if ((strField[i] == m_cDelimiter)
		 || (strField[i] == '"')
		 || (strField[i] == '\n')
		 || (strField[i] == '\r')
		) {
			fQuote = true;
			break;
		}
	}
	if (!fQuote) {
		return strField;
	}

	std::string strQuoted = "\"";
	for (size_t i = 0; i < strField.length(); i++) {
		if (strField[i] == '"') {
			strQuoted += "\"\"";
		} else {
			strQuoted += strField[i];
		}
	}
	strQuoted += "\"";
	return strQuoted;
}

///////////////////////////////////////////////////////////////////////////////

std::string DelimitedTableSink::FormatRecord(
	const std::vector<std::string> & vecFields
) const {
	std::string strRecord;
	for (size_t i = 0; i < vecFields.size(); i++) {
		if (i != 0) {
			strRecord += m_cDelimiter;
		}
		strRecord += QuoteField(vecFields[i]);
	}
	return strRecord;
}

///////////////////////////////////////////////////////////////////////////////

void DelimitedTableSink::Write(
	const std::string & strPath,
	const Table & table
) const {
	FILE * fpOutput = fopen(strPath.c_str(), "w");
	if (fpOutput == NULL) {
		_EXCEPTION1("Error opening file \"%s\" for writing",
			strPath.c_str());
	}

	fprintf(fpOutput, "%s\n", FormatRecord(table.vecColumns).c_str());

	for (size_t r = 0; r < table.vecRows.size(); r++) {
		if (table.vecRows[r].size() != table.vecColumns.size()) {
			fclose(fpOutput);
			_EXCEPTION3("Row %lu of table \"%s\" has %lu fields",
				static_cast<unsigned long>(r),
				strPath.c_str(),
				static_cast<unsigned long>(table.vecRows[r].size()));
		}
		fprintf(fpOutput, "%s\n", FormatRecord(table.vecRows[r]).c_str());
	}

	if (ferror(fpOutput)) {
		fclose(fpOutput);
		_EXCEPTION1("Error writing file \"%s\"", strPath.c_str());
	}
	if (fclose(fpOutput) != 0) {
		_EXCEPTION1("Error closing file \"%s\"", strPath.c_str());
	}
}

///////////////////////////////////////////////////////////////////////////////

