#include "gene_interval_index.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

#include <boost/algorithm/string/join.hpp>

IntervalTree::IntervalTree()
  : built(false) { }

void IntervalTree::insert(int start, int end, size_t data) {
  if (end < start) {
    throw invalid_argument("interval end " + to_string(end) + " before start " + to_string(start));
  }
  this->intervals.push_back(interval_t {start, end, data});
  this->built = false;
}

void IntervalTree::build() {
  vector<size_t> indices(this->intervals.size());
  for (size_t i = 0; i < indices.size(); ++i) {
    indices[i] = i;
  }
  this->root = this->build_node(indices);
  this->built = true;
}

unique_ptr<IntervalTree::node_t> IntervalTree::build_node(vector<size_t>& indices) {
  if (indices.empty()) {
    return nullptr;
  }

  // the median start keeps both subtrees at most half the size
  vector<int> starts;
  for (const size_t& i : indices) {
    starts.push_back(this->intervals[i].start);
  }
  std::nth_element(starts.begin(), starts.begin() + starts.size()/2, starts.end());

  unique_ptr<node_t> node = make_unique<node_t>();
  node->center = starts[starts.size()/2];

  vector<size_t> left_indices;
  vector<size_t> right_indices;
  for (const size_t& i : indices) {
    const interval_t& interval = this->intervals[i];
    if (interval.end < node->center) {
      left_indices.push_back(i);
    } else if (interval.start > node->center) {
      right_indices.push_back(i);
    } else {
      node->by_start.push_back(i);
    }
  }

  node->by_end = node->by_start;
  std::sort(node->by_start.begin(), node->by_start.end(), [this](size_t a, size_t b) {
    return this->intervals[a].start < this->intervals[b].start;
  });
  std::sort(node->by_end.begin(), node->by_end.end(), [this](size_t a, size_t b) {
    return this->intervals[a].end > this->intervals[b].end;
  });

  node->left = this->build_node(left_indices);
  node->right = this->build_node(right_indices);
  return node;
}

void IntervalTree::query_node(const node_t* node, int pos, vector<size_t>& hits) const {
  while (node != nullptr) {
    if (pos < node->center) {
      for (const size_t& i : node->by_start) {
        if (this->intervals[i].start > pos) {
          break;
        }
        hits.push_back(i);
      }
      node = node->left.get();
    } else if (pos > node->center) {
      for (const size_t& i : node->by_end) {
        if (this->intervals[i].end < pos) {
          break;
        }
        hits.push_back(i);
      }
      node = node->right.get();
    } else {
      hits.insert(hits.end(), node->by_start.begin(), node->by_start.end());
      return;
    }
  }
}

vector<size_t> IntervalTree::query(int pos) const {
  if (!this->built) {
    throw runtime_error("IntervalTree queried before build");
  }
  vector<size_t> hits;
  this->query_node(this->root.get(), pos, hits);
  std::sort(hits.begin(), hits.end());

  vector<size_t> data;
  for (const size_t& i : hits) {
    data.push_back(this->intervals[i].data);
  }
  return data;
}

GeneIntervalIndex::GeneIntervalIndex()
  : built(false) { }

void GeneIntervalIndex::add(const gene_interval_t& interval) {
  this->trees[interval.chr].insert(interval.start, interval.end, this->genes.size());
  this->genes.push_back(interval);
  this->built = false;
}

void GeneIntervalIndex::build() {
  for (auto& entry : this->trees) {
    entry.second.build();
  }
  this->built = true;
}

vector<gene_interval_t> GeneIntervalIndex::search_position(const string& chr, const int& pos) const {
  if (!this->built) {
    throw runtime_error("GeneIntervalIndex queried before build");
  }
  vector<gene_interval_t> overlapping;
  auto it = this->trees.find(chr);
  if (it == this->trees.end()) {
    return overlapping;
  }

  for (const size_t& i : it->second.query(pos)) {
    overlapping.push_back(this->genes[i]);
  }
  std::stable_sort(overlapping.begin(), overlapping.end(), [](const gene_interval_t& a, const gene_interval_t& b) {
    if (a.start != b.start) {
      return a.start < b.start;
    }
    return a.end < b.end;
  });
  return overlapping;
}

vector<string> GeneIntervalIndex::get_gene_ids(const string& chr, const int& pos) const {
  vector<string> gene_ids;
  unordered_set<string> seen;
  for (const gene_interval_t& gene : this->search_position(chr, pos)) {
    if (seen.insert(gene.gene_id).second) {
      gene_ids.push_back(gene.gene_id);
    }
  }
  return gene_ids;
}

string GeneIntervalIndex::get_genes_field(const string& chr, const int& pos) const {
  return boost::algorithm::join(this->get_gene_ids(chr, pos), ",");
}
