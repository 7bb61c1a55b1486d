#ifndef ASEMETA_GENE_INTERVAL_INDEX_H
#define ASEMETA_GENE_INTERVAL_INDEX_H

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
using namespace std;

struct gene_interval_t {
  string gene_id;
  string chr;
  int start;
  int end;
};

/**
 * Centered interval tree over the intervals of a single chromosome.
 * Intervals are 1-based and closed. insert all intervals, then build once
 * before querying.
 */
class IntervalTree {
 public:
  IntervalTree();

  void insert(int start, int end, size_t data);

  void build();

  // data of all intervals containing pos, in insertion order
  vector<size_t> query(int pos) const;

  size_t size() const { return this->intervals.size(); }

 private:
  struct interval_t {
    int start;
    int end;
    size_t data;
  };

  struct node_t {
    int center;
    vector<size_t> by_start;  // overlapping center, ascending start
    vector<size_t> by_end;    // overlapping center, descending end
    unique_ptr<node_t> left;
    unique_ptr<node_t> right;
  };

  unique_ptr<node_t> build_node(vector<size_t>& indices);
  void query_node(const node_t* node, int pos, vector<size_t>& hits) const;

  vector<interval_t> intervals;
  unique_ptr<node_t> root;
  bool built;
};

/**
 * Gene intervals partitioned by chromosome, used to annotate variants with
 * the genes overlapping their position.
 */
class GeneIntervalIndex {
 public:
  GeneIntervalIndex();

  void add(const gene_interval_t& interval);

  void build();

  // overlapping intervals ordered by start, end and insertion order
  vector<gene_interval_t> search_position(const string& chr, const int& pos) const;

  // ids of overlapping genes, each id once, in the order of search_position
  vector<string> get_gene_ids(const string& chr, const int& pos) const;

  // get_gene_ids joined with ','
  string get_genes_field(const string& chr, const int& pos) const;

  size_t size() const { return this->genes.size(); }

 private:
  vector<gene_interval_t> genes;
  unordered_map<string, IntervalTree> trees;
  bool built;
};

#endif
