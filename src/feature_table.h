#ifndef LARYNX_FEATURE_TABLE_H
#define LARYNX_FEATURE_TABLE_H

#include "common.h"
#include <vector>
#include <map>

typedef std::vector<size_t> Shape;

// append-only store of named tensor-valued columns, one cell per row
class FeatureSink
{
public:

  virtual ~FeatureSink () {}

  virtual void add_column_if_absent (const string & name, const Shape & shape) = 0;
  virtual void write_cell (
      const string & name,
      size_t row,
      const Shape & index,
      float value) = 0;
};

/** In-memory feature table.

  Columns are registered lazily by name; cells are dense row-major arrays
  of the column's shape. Writing to a row past the end appends rows.
*/

class FeatureTable : public FeatureSink
{
  struct Column
  {
    Shape shape;
    size_t cell_size;
    std::vector<std::vector<float> > rows;
  };

  typedef std::map<string, Column> Columns;
  Columns m_columns;
  std::vector<string> m_order;
  size_t m_rows;

public:

  FeatureTable () : m_rows(0) {}
  virtual ~FeatureTable () {}

  virtual void add_column_if_absent (const string & name, const Shape & shape);
  virtual void write_cell (
      const string & name,
      size_t row,
      const Shape & index,
      float value);

  size_t rows () const { return m_rows; }
  size_t columns () const { return m_columns.size(); }
  bool has_column (const string & name) const
  {
    return m_columns.find(name) != m_columns.end();
  }
  const std::vector<string> & column_names () const { return m_order; }
  const Shape & shape (const string & name) const;

  const std::vector<float> & cell (const string & name, size_t row) const;
  float value (const string & name, size_t row, const Shape & index) const;

  void clear_rows ();

  // one line per cell: name row values...
  void write (ostream & os) const;

private:

  const Column & column (const string & name) const;
  static size_t offset (const Shape & shape, const Shape & index);
  void ensure_rows (size_t rows);
};

#endif // LARYNX_FEATURE_TABLE_H

