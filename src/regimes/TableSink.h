///////////////////////////////////////////////////////////////////////////////
///
///	\file    TableSink.h
///	\version October 19, 2026
///
///	<summary>
///		Output of tabular results.
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

#ifndef _TABLESINK_H_
#define _TABLESINK_H_

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A column schema and rows of string fields.
///	</summary>
class Table {

public:
	///	<summary>
	///		Append a row.  Throws an Exception if the row width does not
	///		match the schema.
	///	</summary>
	void AddRow(
		const std::vector<std::string> & vecRow
	);

	size_t GetColumnCount() const {
		return vecColumns.size();
	}

	size_t GetRowCount() const {
		return vecRows.size();
	}

	///	<summary>
	///		Index of the named column, or -1.
	///	</summary>
	int FindColumn(
		const std::string & strColumn
	) const;

public:
	std::vector<std::string> vecColumns;

	std::vector< std::vector<std::string> > vecRows;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Format a floating point value for a table field.
///	</summary>
std::string FormatTableReal(
	double dValue,
	const char * szFormat = "%.10g"
);

///	<summary>
///		Format an integer value for a table field.
///	</summary>
std::string FormatTableInteger(
	long lValue
);

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A destination for tables.
///	</summary>
class TableSink {

public:
	virtual ~TableSink() { }

	///	<summary>
	///		Write a table to the given path.
	///	</summary>
	virtual void Write(
		const std::string & strPath,
		const Table & table
	) const = 0;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Writes delimited text with a header line.  Fields containing the
///		delimiter, a double quote or a line break are quoted.
///	</summary>
class DelimitedTableSink : public TableSink {

public:
	explicit DelimitedTableSink(
		char cDelimiter = ','
	) :
		m_cDelimiter(cDelimiter)
	{ }

	///	<summary>
	///		Parse a delimiter option: "," or "comma", "tab" or "\t",
	///		";" or any other single character.
	///	</summary>
	static char ParseDelimiter(
		const std::string & strDelimiter
	);

	char GetDelimiter() const {
		return m_cDelimiter;
	}

	///	<summary>
	///		Format one record, without the line terminator.
	///	</summary>
	std::string FormatRecord(
		const std::vector<std::string> & vecFields
	) const;

	virtual void Write(
		const std::string & strPath,
		const Table & table
	) const;

protected:
	///	<summary>
	///		Quote a field if needed.
	///	</summary>
	std::string QuoteField(
		const std::string & strField
	) const;

private:
	char m_cDelimiter;
};

///////////////////////////////////////////////////////////////////////////////

#endif

