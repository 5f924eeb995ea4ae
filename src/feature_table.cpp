
#include "feature_table.h"

void FeatureTable::add_column_if_absent (const string & name, const Shape & shape)
{
  Columns::iterator i = m_columns.find(name);
  if (i != m_columns.end()) {
    ASSERT(i->second.shape == shape,
        "column " << name << " already exists with a different shape");
    return;
  }

  Column & col = m_columns[name];
  col.shape = shape;
  col.cell_size = 1;
  for (size_t d = 0; d < shape.size(); ++d) col.cell_size *= shape[d];
  col.rows.resize(m_rows, std::vector<float>(col.cell_size, 0.0f));
  m_order.push_back(name);
}

void FeatureTable::write_cell (
    const string & name,
    size_t row,
    const Shape & index,
    float value)
{
  Columns::iterator i = m_columns.find(name);
  ASSERT(i != m_columns.end(), "unknown feature column " << name);

  ensure_rows(row + 1);
  Column & col = i->second;
  col.rows[row][offset(col.shape, index)] = value;
}

const Shape & FeatureTable::shape (const string & name) const
{
  return column(name).shape;
}

const std::vector<float> & FeatureTable::cell (
    const string & name,
    size_t row) const
{
  const Column & col = column(name);
  ASSERT_LT(row, m_rows);
  return col.rows[row];
}

float FeatureTable::value (
    const string & name,
    size_t row,
    const Shape & index) const
{
  const Column & col = column(name);
  ASSERT_LT(row, m_rows);
  return col.rows[row][offset(col.shape, index)];
}

void FeatureTable::clear_rows ()
{
  for (Columns::iterator i = m_columns.begin(); i != m_columns.end(); ++i) {
    i->second.rows.clear();
  }
  m_rows = 0;
}

void FeatureTable::write (ostream & os) const
{
  for (size_t r = 0; r < m_rows; ++r) {
    for (size_t c = 0; c < m_order.size(); ++c) {
      const string & name = m_order[c];
      const Column & col = column(name);
      os << name << ' ' << r;
      for (size_t d = 0; d < col.shape.size(); ++d) {
        os << (d ? 'x' : ' ') << col.shape[d];
      }
      const std::vector<float> & values = col.rows[r];
      for (size_t i = 0; i < values.size(); ++i) os << ' ' << values[i];
      os << '\n';
    }
  }
  os << flush;
}

const FeatureTable::Column & FeatureTable::column (const string & name) const
{
  Columns::const_iterator i = m_columns.find(name);
  ASSERT(i != m_columns.end(), "unknown feature column " << name);
  return i->second;
}

size_t FeatureTable::offset (const Shape & shape, const Shape & index)
{
  ASSERT_EQ(index.size(), shape.size());

  size_t result = 0;
  for (size_t d = 0; d < shape.size(); ++d) {
    ASSERT_LT(index[d], shape[d]);
    result = result * shape[d] + index[d];
  }
  return result;
}

void FeatureTable::ensure_rows (size_t rows)
{
  if (rows <= m_rows) return;

  for (Columns::iterator i = m_columns.begin(); i != m_columns.end(); ++i) {
    Column & col = i->second;
    col.rows.resize(rows, std::vector<float>(col.cell_size, 0.0f));
  }
  m_rows = rows;
}

