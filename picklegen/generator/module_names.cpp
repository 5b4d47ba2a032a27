// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <picklegen/generator/module_names.hpp>

#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace
{
    constexpr std::string_view module_corpus = R"(
builtins.object
builtins.int
builtins.float
builtins.complex
builtins.str
builtins.bytes
builtins.bytearray
builtins.list
builtins.tuple
builtins.dict
builtins.set
builtins.frozenset
builtins.bool
builtins.range
builtins.slice
builtins.type
builtins.len
builtins.getattr
builtins.setattr
builtins.print
builtins.repr
builtins.format
builtins.iter
builtins.map
builtins.filter
builtins.zip
builtins.enumerate
builtins.reversed
builtins.sorted
builtins.min
builtins.max
builtins.sum
builtins.abs
builtins.divmod
builtins.pow
builtins.round
builtins.hash
builtins.id
builtins.isinstance
builtins.issubclass
builtins.memoryview
builtins.property
builtins.staticmethod
builtins.classmethod
builtins.super
builtins.Exception
builtins.ValueError
builtins.TypeError
builtins.KeyError
builtins.IndexError
builtins.AttributeError
builtins.RuntimeError
builtins.OSError
builtins.StopIteration
builtins.NotImplementedError
builtins.Ellipsis
builtins.NotImplemented
collections.OrderedDict
collections.defaultdict
collections.deque
collections.Counter
collections.ChainMap
collections.namedtuple
collections.abc.Mapping
copyreg._reconstructor
copyreg.__newobj__
copyreg.__newobj_ex__
copyreg._reduce_ex
copy.copy
copy.deepcopy
datetime.date
datetime.time
datetime.datetime
datetime.timedelta
datetime.timezone
decimal.Decimal
decimal.Context
fractions.Fraction
functools.partial
functools.reduce
functools.cmp_to_key
functools.lru_cache
itertools.chain
itertools.count
itertools.cycle
itertools.repeat
itertools.islice
itertools.product
itertools.permutations
itertools.combinations
itertools.starmap
operator.add
operator.sub
operator.mul
operator.itemgetter
operator.attrgetter
operator.methodcaller
operator.getitem
operator.setitem
math.sqrt
math.floor
math.ceil
math.pow
math.log
math.exp
math.inf
math.nan
random.Random
random.random
random.randint
re.compile
re.match
re.Pattern
string.Template
string.Formatter
struct.pack
struct.unpack
struct.Struct
array.array
enum.Enum
enum.IntEnum
enum.Flag
uuid.UUID
uuid.uuid4
pathlib.Path
pathlib.PurePosixPath
pathlib.PureWindowsPath
ipaddress.IPv4Address
ipaddress.IPv6Address
ipaddress.ip_network
json.dumps
json.loads
json.JSONDecoder
json.JSONEncoder
codecs.encode
codecs.decode
base64.b64encode
base64.b64decode
binascii.hexlify
binascii.unhexlify
zlib.compress
zlib.decompress
hashlib.sha256
hashlib.md5
hmac.new
types.SimpleNamespace
types.FunctionType
types.MappingProxyType
weakref.ref
weakref.WeakValueDictionary
heapq.heappush
heapq.heappop
bisect.bisect_left
bisect.insort
io.BytesIO
io.StringIO
os.getcwd
os.path.join
os.environ
sys.modules
sys.getrecursionlimit
time.time
time.struct_time
calendar.Calendar
locale.getlocale
textwrap.dedent
shlex.split
argparse.Namespace
logging.getLogger
logging.Logger
threading.Lock
queue.Queue
contextlib.nullcontext
dataclasses.field
typing.NamedTuple
typing.Any
numbers.Number
statistics.mean
pickle.loads
pickle.dumps
pickle.PickleBuffer
_codecs.encode
_struct.unpack
)";

    std::vector<std::string> parse_corpus(std::string_view text)
    {
        std::vector<std::string> names;
        while (!text.empty()) {
            auto const nl = text.find('\n');
            auto const line = text.substr(0, nl);
            if (!line.empty()) {
                names.emplace_back(line);
            }
            if (nl == std::string_view::npos) {
                break;
            }
            text.remove_prefix(nl + 1);
        }
        return names;
    }
}

namespace picklegen
{
    std::span<std::string const> module_names()
    {
        static std::vector<std::string> const names =
            parse_corpus(module_corpus);
        return names;
    }

    std::pair<std::string_view, std::string_view>
    split_module_name(std::string_view const qualified)
    {
        auto const dot = qualified.find('.');
        if (dot == std::string_view::npos) {
            return {"builtins", qualified};
        }
        return {qualified.substr(0, dot), qualified.substr(dot + 1)};
    }
}
